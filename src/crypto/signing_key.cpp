#include <veritas/common/critical.hpp>
#include <veritas/crypto/hmac.hpp>
#include <veritas/crypto/signing_key.hpp>

#include <openssl/evp.h>

#include <memory>

namespace veritas::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_private_key(const veritas::schema::hash32_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(
                          EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
                      EVP_PKEY_free};
}

}  // namespace

signing_key::signing_key(const veritas::schema::hash32_t& seed,
                         const veritas::schema::public_key_t& public_key)
    : seed_{seed}, public_key_{public_key} {}

signing_key signing_key::generate() {
  auto error = std::string{};
  auto key = from_seed(random_bytes(32), error);
  if (!key) {
    veritas::common::critical("failed to generate Ed25519 key", error);
  }
  return *key;
}

std::optional<signing_key> signing_key::from_seed(
    const veritas::schema::bytes_view_t& seed,
    std::string& error) {
  auto seed32 = veritas::schema::try_make_hash32(seed);
  if (!seed32) {
    error = "Ed25519 seed must be 32 bytes";
    return std::nullopt;
  }
  auto pkey = make_private_key(*seed32);
  if (!pkey) {
    error = "OpenSSL rejected Ed25519 seed";
    return std::nullopt;
  }
  auto public_key = veritas::schema::public_key_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &length) !=
          1 ||
      length != public_key.size()) {
    error = "failed to derive Ed25519 public key";
    return std::nullopt;
  }
  return signing_key{*seed32, public_key};
}

std::optional<signing_key> signing_key::from_hex(const std::string_view& hex,
                                                 std::string& error) {
  auto seed = veritas::schema::try_from_hex(hex);
  if (!seed) {
    error = "signing key is not valid hex";
    return std::nullopt;
  }
  return from_seed(*seed, error);
}

const veritas::schema::public_key_t& signing_key::public_key() const {
  return public_key_;
}

const veritas::schema::hash32_t& signing_key::seed() const {
  return seed_;
}

veritas::schema::signature_t signing_key::sign(
    const veritas::schema::bytes_view_t& message) const {
  auto pkey = make_private_key(seed_);
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!pkey || !ctx) {
    veritas::common::critical("failed to allocate Ed25519 signing context");
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    veritas::common::critical("EVP_DigestSignInit failed");
  }
  auto signature = veritas::schema::signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    veritas::common::critical("EVP_DigestSign failed");
  }
  return signature;
}

}  // namespace veritas::crypto
