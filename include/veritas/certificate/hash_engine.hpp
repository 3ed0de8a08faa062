#pragma once

#include <veritas/crypto/signing_key.hpp>
#include <veritas/schema/certificate_fields.hpp>
#include <veritas/schema/issued_certificate.hpp>
#include <veritas/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace veritas::certificate {

inline constexpr std::size_t kSaltSize = 32;
inline constexpr std::size_t kMinimumSaltSize = 16;

/// Fingerprint and attestation of certificates.
///
/// fingerprint = HMAC-SHA256(key = salt, message = canonicalize(fields))
/// signature   = Ed25519(service key, fingerprint)
///
/// Nothing is persisted here; the caller stores the salt with the record.
class hash_engine final {
 public:
  explicit hash_engine(veritas::crypto::signing_key key);

  /// Fresh salt, fingerprint and signature for `fields`.
  std::optional<veritas::schema::issued_certificate_t> issue(
      const veritas::schema::certificate_fields_t& fields,
      std::string& error) const;

  /// Pure recomputation with a stored salt. Salts shorter than
  /// kMinimumSaltSize are rejected.
  static std::optional<veritas::schema::fingerprint_t> recompute(
      const veritas::schema::certificate_fields_t& fields,
      const veritas::schema::bytes_view_t& salt,
      std::string& error);

  static bool verify_signature(
      const veritas::schema::fingerprint_t& fingerprint,
      const veritas::schema::signature_t& signature,
      const veritas::schema::public_key_t& public_key);

  /// Constant-time fingerprint comparison.
  static bool same_fingerprint(const veritas::schema::fingerprint_t& lhs,
                               const veritas::schema::fingerprint_t& rhs);

  const veritas::schema::public_key_t& public_key() const;

 private:
  veritas::crypto::signing_key key_;
};

}  // namespace veritas::certificate
