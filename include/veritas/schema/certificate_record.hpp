#pragma once
#include <veritas/schema/certificate_fields.hpp>
#include <veritas/schema/primitives.hpp>

// Schema type: certificate record.
// Local (off-chain) record persisted once at issuance. Holds the normalized
// fields, the salt needed to reproduce the fingerprint, and the attestation
// signature. Never mutated after insertion.
namespace veritas::schema {

template <uint16_t Version>
struct certificate_record;

template <>
struct certificate_record<1> final {
  uint16_t version{1};
  certificate_fields_t fields;
  bytes_t salt;
  fingerprint_t fingerprint{};
  signature_t signature{};
  public_key_t signer{};
  timestamp_milliseconds_t issued_at{};
};

using certificate_record_t = certificate_record<1>;

}  // namespace veritas::schema
