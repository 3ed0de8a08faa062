#include <veritas/blake3/hash.hpp>
#include <veritas/crypto/verify.hpp>
#include <veritas/registry/transaction_signing.hpp>

#include <tuple>

namespace veritas::registry {

veritas::schema::chain_id_t make_chain_id(const std::string_view& chain_name) {
  return veritas::blake3::hash(chain_name);
}

veritas::schema::bytes_t make_signing_payload(
    veritas::scale_encoder_t& encoder,
    const veritas::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

veritas::schema::transaction_id_t make_transaction_id(
    const veritas::schema::bytes_view_t& raw_tx) {
  return veritas::blake3::hash(raw_tx);
}

void sign_transaction(veritas::scale_encoder_t& encoder,
                      const veritas::crypto::signing_key& key,
                      veritas::schema::transaction_t& tx) {
  tx.signer = key.public_key();
  auto payload = make_signing_payload(encoder, tx);
  tx.signature = key.sign(payload);
}

bool verify_transaction_signature(veritas::scale_encoder_t& encoder,
                                  const veritas::schema::transaction_t& tx) {
  auto payload = make_signing_payload(encoder, tx);
  return veritas::crypto::verify_signature(payload, tx.signer, tx.signature);
}

}  // namespace veritas::registry
