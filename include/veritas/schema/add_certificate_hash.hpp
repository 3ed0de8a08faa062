#pragma once
#include <veritas/schema/primitives.hpp>

// Schema type: add certificate hash.
// Registry call `addCertificateHash(bytes32)`; owner-gated, write-once per
// fingerprint.
namespace veritas::schema {

template <uint16_t Version>
struct add_certificate_hash;

template <>
struct add_certificate_hash<1> final {
  uint16_t version{1};
  fingerprint_t fingerprint{};
};

using add_certificate_hash_t = add_certificate_hash<1>;

}  // namespace veritas::schema
