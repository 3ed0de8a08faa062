#pragma once

#include <veritas/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace veritas::crypto {

/// Ed25519 private key held as its 32-byte seed. The service holds exactly
/// one, loaded at startup and read-only afterwards.
class signing_key final {
 public:
  static signing_key generate();
  static std::optional<signing_key> from_seed(
      const veritas::schema::bytes_view_t& seed,
      std::string& error);
  static std::optional<signing_key> from_hex(const std::string_view& hex,
                                             std::string& error);

  const veritas::schema::public_key_t& public_key() const;
  const veritas::schema::hash32_t& seed() const;

  veritas::schema::signature_t sign(
      const veritas::schema::bytes_view_t& message) const;

 private:
  signing_key(const veritas::schema::hash32_t& seed,
              const veritas::schema::public_key_t& public_key);

  veritas::schema::hash32_t seed_{};
  veritas::schema::public_key_t public_key_{};
};

}  // namespace veritas::crypto
