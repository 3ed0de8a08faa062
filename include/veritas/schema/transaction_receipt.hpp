#pragma once

#include <veritas/schema/enum_string.hpp>
#include <veritas/schema/primitives.hpp>
#include <veritas/schema/transaction_result.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction receipt.
// Written when a queued transaction executes in a block. A receipt with a
// non-zero code is a revert: fee and nonce are consumed, registry state is
// untouched.
namespace veritas::schema {

enum class receipt_status_t : uint8_t {
  unknown = 0,
  pending = 1,
  confirmed = 2
};

inline constexpr auto kReceiptStatusMappings =
    std::array{std::pair<std::string_view, receipt_status_t>{
                   "unknown", receipt_status_t::unknown},
               std::pair<std::string_view, receipt_status_t>{
                   "pending", receipt_status_t::pending},
               std::pair<std::string_view, receipt_status_t>{
                   "confirmed", receipt_status_t::confirmed}};

inline constexpr std::string_view to_string(const receipt_status_t value) {
  return to_string(value, kReceiptStatusMappings).value_or("unknown");
}

template <uint16_t Version>
struct transaction_receipt;

template <>
struct transaction_receipt<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  uint64_t height{};
  uint32_t index{};
  transaction_result_t result;
};

using transaction_receipt_t = transaction_receipt<1>;

struct receipt_query_t final {
  receipt_status_t status{receipt_status_t::unknown};
  std::optional<transaction_receipt_t> receipt;
};

}  // namespace veritas::schema
