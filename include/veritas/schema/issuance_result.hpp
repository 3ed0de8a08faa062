#pragma once
#include <veritas/schema/certificate_record.hpp>
#include <veritas/schema/chain_error_code.hpp>
#include <veritas/schema/primitives.hpp>

#include <optional>
#include <string>

namespace veritas::schema {

template <uint16_t Version>
struct issuance_result;

/// The record is always persisted when an issuance_result exists; a set
/// `chain_error` means registration must be retried out-of-band.
template <>
struct issuance_result<1> final {
  uint16_t version{1};
  certificate_record_t record;
  std::optional<transaction_id_t> transaction_id;
  std::optional<chain_error_code> chain_error;
  std::string chain_message;
};

using issuance_result_t = issuance_result<1>;

}  // namespace veritas::schema
