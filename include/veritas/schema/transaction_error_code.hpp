#pragma once

#include <cstdint>

namespace veritas::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  insufficient_funds = 6,
  mempool_full = 7,
  not_owner = 10,
  duplicate_entry = 11,
};

inline constexpr uint32_t to_code(const transaction_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace veritas::schema
