#pragma once
#include <veritas/schema/primitives.hpp>

namespace veritas::schema {

template <uint16_t Version>
struct issued_certificate;

template <>
struct issued_certificate<1> final {
  uint16_t version{1};
  fingerprint_t fingerprint{};
  bytes_t salt;
  signature_t signature{};
  public_key_t signer{};
};

using issued_certificate_t = issued_certificate<1>;

}  // namespace veritas::schema
