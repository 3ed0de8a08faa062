#pragma once
#include <veritas/schema/add_certificate_hash.hpp>
#include <veritas/schema/primitives.hpp>

namespace veritas::schema {

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  chain_id_t chain_id{};
  uint64_t nonce{};
  public_key_t signer{};
  add_certificate_hash_t payload{};
  // Ed25519 over the encoded body without this field.
  signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace veritas::schema
