#pragma once

#include <veritas/crypto/signing_key.hpp>
#include <veritas/schema/encoding/scale/encoder.hpp>
#include <veritas/schema/primitives.hpp>
#include <veritas/schema/transaction.hpp>

#include <string_view>

namespace veritas::registry {

/// BLAKE3 of the chain name.
veritas::schema::chain_id_t make_chain_id(const std::string_view& chain_name);

/// Bytes covered by the transaction signature: the SCALE encoding of every
/// field except the signature itself.
veritas::schema::bytes_t make_signing_payload(
    veritas::scale_encoder_t& encoder,
    const veritas::schema::transaction_t& tx);

/// BLAKE3 of the full encoded (signed) transaction.
veritas::schema::transaction_id_t make_transaction_id(
    const veritas::schema::bytes_view_t& raw_tx);

void sign_transaction(veritas::scale_encoder_t& encoder,
                      const veritas::crypto::signing_key& key,
                      veritas::schema::transaction_t& tx);

bool verify_transaction_signature(veritas::scale_encoder_t& encoder,
                                  const veritas::schema::transaction_t& tx);

}  // namespace veritas::registry
