#pragma once

#include <veritas/certificate/hash_engine.hpp>
#include <veritas/certificate/record_store.hpp>
#include <veritas/chain/client.hpp>
#include <veritas/schema/certificate_fields.hpp>
#include <veritas/schema/issuance_result.hpp>

#include <optional>
#include <string>

namespace veritas::certificate {

/// True when the fingerprint is known to be on chain: confirmed, or refused
/// as a duplicate.
bool registered(const veritas::schema::issuance_result_t& result);

/// Issuance flow: fingerprint and sign, persist the record, then register
/// the fingerprint on chain.
///
/// The record is persisted before any chain call and survives every chain
/// failure. A failed registration is reported in `chain_error`;
/// `retry_registration` repeats it for a stored record.
class issuer final {
 public:
  issuer(const hash_engine& engine,
         record_store& records,
         veritas::chain::client& chain);

  /// std::nullopt (with `error`) when the fields are rejected or a record
  /// for the same certificate already exists; nothing is written then.
  std::optional<veritas::schema::issuance_result_t> issue(
      const veritas::schema::certificate_fields_t& fields,
      std::string& error);

  std::optional<veritas::schema::issuance_result_t> retry_registration(
      const veritas::schema::fingerprint_t& fingerprint,
      std::string& error);

 private:
  void register_record(veritas::schema::issuance_result_t& result);

  const hash_engine& engine_;
  record_store& records_;
  veritas::chain::client& chain_;
};

}  // namespace veritas::certificate
