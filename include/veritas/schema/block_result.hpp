#pragma once

#include <veritas/schema/primitives.hpp>
#include <veritas/schema/transaction_receipt.hpp>
#include <cstdint>
#include <vector>

namespace veritas::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  uint64_t height{};
  std::vector<transaction_receipt_t> receipts;
  hash32_t state_root{};
};

using block_result_t = block_result<1>;

}  // namespace veritas::schema
