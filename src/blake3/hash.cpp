#include <veritas/blake3/hash.hpp>

namespace veritas::blake3 {

veritas::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

veritas::schema::hash32_t hash(const veritas::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const veritas::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

veritas::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = veritas::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

}  // namespace veritas::blake3
