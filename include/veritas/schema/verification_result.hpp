#pragma once
#include <veritas/schema/certificate_record.hpp>
#include <veritas/schema/chain_error_code.hpp>
#include <veritas/schema/primitives.hpp>
#include <veritas/schema/verification_verdict.hpp>

#include <optional>
#include <string>

namespace veritas::schema {

template <uint16_t Version>
struct verification_result;

template <>
struct verification_result<1> final {
  uint16_t version{1};
  verification_verdict_t verdict{verification_verdict_t::not_found};
  // Matched stored record; set for verified_on_chain and
  // record_found_not_on_chain only.
  std::optional<certificate_record_t> record;
  std::optional<transaction_id_t> transaction_id;
  // Set for chain_unreachable.
  std::optional<chain_error_code> chain_error;
  std::string reason;
};

using verification_result_t = verification_result<1>;

}  // namespace veritas::schema
