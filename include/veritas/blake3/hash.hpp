#pragma once
#include <blake3.h>
#include <veritas/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace veritas::blake3 {

veritas::schema::hash32_t hash(const std::string_view& str);
veritas::schema::hash32_t hash(const veritas::schema::bytes_view_t& bytes);

/// Incremental BLAKE3 over several inputs, used where the digest covers a
/// sequence of values (state root, chain id derivation).
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const veritas::schema::bytes_view_t& bytes);
  veritas::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

}  // namespace veritas::blake3
