#pragma once

#include <veritas/schema/primitives.hpp>

namespace veritas::crypto {

bool available();

bool verify_signature(const veritas::schema::bytes_view_t& message,
                      const veritas::schema::public_key_t& public_key,
                      const veritas::schema::signature_t& signature);

}  // namespace veritas::crypto
