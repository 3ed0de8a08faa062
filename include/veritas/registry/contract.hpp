#pragma once

#include <veritas/schema/add_certificate_hash.hpp>
#include <veritas/schema/primitives.hpp>
#include <veritas/schema/transaction_error_code.hpp>
#include <veritas/schema/transaction_event.hpp>
#include <veritas/schema/transaction_event_attribute.hpp>
#include <veritas/schema/transaction_result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace veritas::registry {

/// Gas charged for one `addCertificateHash` call, revert or not.
inline constexpr int64_t kAddCertificateHashGas = 45'000;

inline constexpr auto kContractCodespace = std::string_view{"veritas.contract"};

/// The certificate hash registry: an owner-gated, write-once
/// `fingerprint -> verified` map.
///
/// `State` provides `bool is_verified(const fingerprint_t&) const` and
/// `void mark_verified(const fingerprint_t&)`. The engine passes a block
/// overlay for execution and a read-only view for admission dry-runs; the
/// contract itself keeps no state besides the owner.
template <typename State>
class contract final {
 public:
  contract(State& state, const veritas::schema::public_key_t& owner)
      : state_{state}, owner_{owner} {}

  /// `addCertificateHash(bytes32)`. Reverts leave `State` untouched.
  veritas::schema::transaction_result_t add_certificate_hash(
      const veritas::schema::public_key_t& caller,
      const veritas::schema::add_certificate_hash_t& call) {
    auto result = veritas::schema::transaction_result_t{};
    result.gas_wanted = kAddCertificateHashGas;
    result.gas_used = kAddCertificateHashGas;
    result.codespace = std::string{kContractCodespace};

    if (caller != owner_) {
      result.code = veritas::schema::to_code(
          veritas::schema::transaction_error_code::not_owner);
      result.log = "caller is not the registry owner";
      return result;
    }
    if (state_.is_verified(call.fingerprint)) {
      result.code = veritas::schema::to_code(
          veritas::schema::transaction_error_code::duplicate_entry);
      result.log = "certificate hash already exists";
      result.info = veritas::schema::to_hex(call.fingerprint);
      return result;
    }

    state_.mark_verified(call.fingerprint);
    result.code = 0;
    result.info = "certificate hash added";
    result.events.push_back(make_hash_added_event(call.fingerprint));
    return result;
  }

  /// `isVerified(bytes32) -> bool`; false for unknown fingerprints.
  bool is_verified(const veritas::schema::fingerprint_t& fingerprint) const {
    return state_.is_verified(fingerprint);
  }

  const veritas::schema::public_key_t& owner() const { return owner_; }

  static veritas::schema::transaction_event_t make_hash_added_event(
      const veritas::schema::fingerprint_t& fingerprint) {
    return veritas::schema::transaction_event_t{
        .type = std::string{veritas::schema::kHashAddedEventType},
        .attributes = {veritas::schema::transaction_event_attribute_t{
            .key = "fingerprint",
            .value = veritas::schema::to_hex(fingerprint),
            .index = true}}};
  }

 private:
  State& state_;
  veritas::schema::public_key_t owner_;
};

}  // namespace veritas::registry
