#pragma once
#include <veritas/schema/primitives.hpp>

// Schema type: genesis.
// Written once when the registry starts on an empty database. The owner is
// immutable afterwards.
namespace veritas::schema {

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  chain_id_t chain_id{};
  public_key_t owner{};
  amount_t owner_balance{};
  amount_t gas_price{1};
};

using genesis_t = genesis<1>;

}  // namespace veritas::schema
