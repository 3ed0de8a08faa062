#pragma once

#include <veritas/certificate/record_store.hpp>
#include <veritas/chain/client.hpp>
#include <veritas/schema/certificate_fields.hpp>
#include <veritas/schema/primitives.hpp>
#include <veritas/schema/verification_result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace veritas::certificate {

/// Two-factor verification of a candidate certificate.
///
/// Checks run in a fixed order and stop at the first failure:
/// 1. normalize the candidate (input errors: std::nullopt + `error`)
/// 2. look up the stored records                    -> not_found
/// 3. recompute with each stored salt until one matches -> hash_mismatch
/// 4. check the stored attestation signature         -> hash_mismatch
/// 5. ask the registry -> verified_on_chain, record_found_not_on_chain
///    or chain_unreachable
/// The chain is only consulted once steps 2-4 pass.
class orchestrator final {
 public:
  orchestrator(const record_store& records,
               veritas::chain::client& chain,
               const veritas::schema::public_key_t& trusted_key);

  /// Look up by the candidate's own (institution, roll).
  std::optional<veritas::schema::verification_result_t> verify(
      const veritas::schema::certificate_fields_t& candidate,
      std::string& error) const;

  /// Look up by an explicit lookup key (see make_lookup_key).
  std::optional<veritas::schema::verification_result_t> verify(
      const veritas::schema::certificate_fields_t& candidate,
      const std::string_view& lookup_key,
      std::string& error) const;

 private:
  veritas::schema::verification_result_t verify_normalized(
      const veritas::schema::certificate_fields_t& candidate,
      const std::string_view& lookup_key) const;

  const record_store& records_;
  veritas::chain::client& chain_;
  veritas::schema::public_key_t trusted_key_;
};

}  // namespace veritas::certificate
