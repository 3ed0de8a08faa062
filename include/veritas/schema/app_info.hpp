#pragma once

#include <veritas/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace veritas::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"veritas-registry"};
  std::string version{"0.1.0"};
  uint64_t app_version{1};
  uint64_t last_block_height{};
  hash32_t last_block_state_root{};
  chain_id_t chain_id{};
  public_key_t owner{};
  amount_t gas_price{};
};

using app_info_t = app_info<1>;

}  // namespace veritas::schema
