#pragma once

#include <veritas/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: verification verdict.
// Outcome of a verification request. `chain_unreachable` is the
// indeterminate state: the local record is consistent but the registry could
// not be read, so neither terminal on-chain verdict applies.
namespace veritas::schema {

enum class verification_verdict_t : uint8_t {
  not_found = 0,
  hash_mismatch = 1,
  record_found_not_on_chain = 2,
  verified_on_chain = 3,
  chain_unreachable = 4
};

inline constexpr auto kVerificationVerdictMappings = std::array{
    std::pair<std::string_view, verification_verdict_t>{
        "NOT_FOUND", verification_verdict_t::not_found},
    std::pair<std::string_view, verification_verdict_t>{
        "HASH_MISMATCH", verification_verdict_t::hash_mismatch},
    std::pair<std::string_view, verification_verdict_t>{
        "RECORD_FOUND_NOT_ON_CHAIN",
        verification_verdict_t::record_found_not_on_chain},
    std::pair<std::string_view, verification_verdict_t>{
        "VERIFIED_ON_CHAIN", verification_verdict_t::verified_on_chain},
    std::pair<std::string_view, verification_verdict_t>{
        "CHAIN_UNREACHABLE", verification_verdict_t::chain_unreachable}};

template <>
inline std::optional<verification_verdict_t>
try_from_string<verification_verdict_t>(const std::string_view value) {
  return from_string(value, kVerificationVerdictMappings);
}

inline constexpr std::string_view to_string(
    const verification_verdict_t value) {
  return to_string(value, kVerificationVerdictMappings).value_or("unknown");
}

}  // namespace veritas::schema
