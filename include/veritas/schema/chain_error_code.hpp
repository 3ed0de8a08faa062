#pragma once

#include <veritas/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: chain error code.
// Client-side classification of registry failures. `duplicate_entry` is
// non-fatal (the fingerprint is registered either way); `network_unavailable`
// and `timeout` are transient and retryable by the caller;
// `insufficient_funds` is fatal to the attempt and never retried.
namespace veritas::schema {

enum class chain_error_code : uint8_t {
  duplicate_entry = 1,
  insufficient_funds = 2,
  network_unavailable = 3,
  timeout = 4,
  not_owner = 5,
  rejected = 6
};

inline constexpr auto kChainErrorCodeMappings = std::array{
    std::pair<std::string_view, chain_error_code>{
        "duplicate_entry", chain_error_code::duplicate_entry},
    std::pair<std::string_view, chain_error_code>{
        "insufficient_funds", chain_error_code::insufficient_funds},
    std::pair<std::string_view, chain_error_code>{
        "network_unavailable", chain_error_code::network_unavailable},
    std::pair<std::string_view, chain_error_code>{"timeout",
                                                  chain_error_code::timeout},
    std::pair<std::string_view, chain_error_code>{"not_owner",
                                                  chain_error_code::not_owner},
    std::pair<std::string_view, chain_error_code>{"rejected",
                                                  chain_error_code::rejected}};

template <>
inline std::optional<chain_error_code> try_from_string<chain_error_code>(
    const std::string_view value) {
  return from_string(value, kChainErrorCodeMappings);
}

inline constexpr std::string_view to_string(const chain_error_code value) {
  return to_string(value, kChainErrorCodeMappings).value_or("unknown");
}

/// Transient failures the caller may retry.
inline constexpr bool is_transient(const chain_error_code value) {
  return value == chain_error_code::network_unavailable ||
         value == chain_error_code::timeout;
}

}  // namespace veritas::schema
