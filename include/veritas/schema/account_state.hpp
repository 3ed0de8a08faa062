#pragma once
#include <veritas/schema/primitives.hpp>

namespace veritas::schema {

template <uint16_t Version>
struct account_state;

template <>
struct account_state<1> final {
  uint16_t version{1};
  uint64_t nonce{};
  amount_t balance{};
};

using account_state_t = account_state<1>;

/// Account view including queued (not yet executed) transactions.
struct account_info_t final {
  uint64_t nonce{};
  uint64_t pending_nonce{};
  amount_t balance{};
  amount_t pending_spend{};
};

}  // namespace veritas::schema
