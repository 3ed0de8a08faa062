#pragma once

#include <veritas/schema/chain_error_code.hpp>
#include <veritas/schema/primitives.hpp>

#include <optional>
#include <string>

namespace veritas::chain {

/// Outcome of `register_fingerprint`. `transaction_id` is set once a
/// transaction was confirmed, which includes a confirmed `duplicate_entry`
/// revert.
struct register_result final {
  std::optional<veritas::schema::transaction_id_t> transaction_id;
  std::optional<veritas::schema::chain_error_code> error;
  std::string message;

  bool ok() const { return !error.has_value(); }
};

struct verify_result final {
  std::optional<bool> verified;
  std::optional<veritas::schema::chain_error_code> error;
  std::string message;
};

/// Chain access used by issuance and verification. Implementations hold the
/// single service signing key and bound every remote call with a deadline.
class client {
 public:
  virtual ~client() = default;

  /// Submit `addCertificateHash(fingerprint)` and block until the
  /// transaction is confirmed or the confirmation timeout elapses.
  virtual register_result register_fingerprint(
      const veritas::schema::fingerprint_t& fingerprint) = 0;

  /// Read-only `isVerified(fingerprint)`.
  virtual verify_result verify(
      const veritas::schema::fingerprint_t& fingerprint) = 0;
};

}  // namespace veritas::chain
