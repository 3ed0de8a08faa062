#include <veritas/certificate/canonical_encoder.hpp>
#include <veritas/certificate/hash_engine.hpp>
#include <veritas/crypto/hmac.hpp>
#include <veritas/crypto/verify.hpp>

#include <utility>

namespace veritas::certificate {

hash_engine::hash_engine(veritas::crypto::signing_key key)
    : key_{std::move(key)} {}

std::optional<veritas::schema::issued_certificate_t> hash_engine::issue(
    const veritas::schema::certificate_fields_t& fields,
    std::string& error) const {
  auto salt = veritas::crypto::random_bytes(kSaltSize);
  auto fingerprint = recompute(fields, salt, error);
  if (!fingerprint) {
    return std::nullopt;
  }
  auto issued = veritas::schema::issued_certificate_t{};
  issued.fingerprint = fingerprint.value();
  issued.salt = std::move(salt);
  issued.signature = key_.sign(issued.fingerprint);
  issued.signer = key_.public_key();
  return issued;
}

std::optional<veritas::schema::fingerprint_t> hash_engine::recompute(
    const veritas::schema::certificate_fields_t& fields,
    const veritas::schema::bytes_view_t& salt,
    std::string& error) {
  auto canonical = canonicalize(fields, error);
  if (!canonical) {
    return std::nullopt;
  }
  if (salt.size() < kMinimumSaltSize) {
    error = "salt must be at least " + std::to_string(kMinimumSaltSize) +
            " bytes";
    return std::nullopt;
  }
  return veritas::crypto::hmac_sha256(salt, canonical.value());
}

bool hash_engine::verify_signature(
    const veritas::schema::fingerprint_t& fingerprint,
    const veritas::schema::signature_t& signature,
    const veritas::schema::public_key_t& public_key) {
  return veritas::crypto::verify_signature(fingerprint, public_key, signature);
}

bool hash_engine::same_fingerprint(const veritas::schema::fingerprint_t& lhs,
                                   const veritas::schema::fingerprint_t& rhs) {
  return veritas::crypto::constant_time_equal(lhs, rhs);
}

const veritas::schema::public_key_t& hash_engine::public_key() const {
  return key_.public_key();
}

}  // namespace veritas::certificate
