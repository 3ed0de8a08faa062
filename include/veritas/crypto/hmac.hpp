#pragma once

#include <veritas/schema/primitives.hpp>

#include <cstddef>

namespace veritas::crypto {

veritas::schema::hash32_t hmac_sha256(
    const veritas::schema::bytes_view_t& key,
    const veritas::schema::bytes_view_t& message);

/// CSPRNG output from OpenSSL RAND_bytes.
veritas::schema::bytes_t random_bytes(std::size_t size);

/// Constant-time comparison (CRYPTO_memcmp). Sizes are not secret.
bool constant_time_equal(const veritas::schema::bytes_view_t& lhs,
                         const veritas::schema::bytes_view_t& rhs);

}  // namespace veritas::crypto
