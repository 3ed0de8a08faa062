#include <veritas/common/critical.hpp>
#include <veritas/crypto/hmac.hpp>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <limits>
#include <memory>

namespace veritas::crypto {

namespace {

using evp_mac_ptr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using evp_mac_ctx_ptr =
    std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

}  // namespace

veritas::schema::hash32_t hmac_sha256(
    const veritas::schema::bytes_view_t& key,
    const veritas::schema::bytes_view_t& message) {
  auto mac = evp_mac_ptr{EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr),
                         EVP_MAC_free};
  if (!mac) {
    veritas::common::critical("OpenSSL HMAC implementation unavailable");
  }
  auto ctx = evp_mac_ctx_ptr{EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free};
  if (!ctx) {
    veritas::common::critical("failed to allocate HMAC context");
  }

  auto* digest = const_cast<char*>("SHA256");
  auto params = std::array{
      OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
      OSSL_PARAM_construct_end()};
  if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params.data()) != 1 ||
      EVP_MAC_update(ctx.get(), message.data(), message.size()) != 1) {
    veritas::common::critical("HMAC-SHA256 computation failed");
  }

  auto output = veritas::schema::hash32_t{};
  auto length = std::size_t{};
  if (EVP_MAC_final(ctx.get(), output.data(), &length, output.size()) != 1 ||
      length != output.size()) {
    veritas::common::critical("HMAC-SHA256 finalization failed");
  }
  return output;
}

veritas::schema::bytes_t random_bytes(std::size_t size) {
  auto output = veritas::schema::bytes_t(size);
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()) ||
      RAND_bytes(output.data(), static_cast<int>(size)) != 1) {
    veritas::common::critical("CSPRNG failure");
  }
  return output;
}

bool constant_time_equal(const veritas::schema::bytes_view_t& lhs,
                         const veritas::schema::bytes_view_t& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace veritas::crypto
