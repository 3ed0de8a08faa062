#pragma once
#include <veritas/schema/primitives.hpp>
#include <optional>
#include <span>

namespace veritas::schema::encoding {

// The wire/storage codec is a build-time choice: callers hold an
// encoder<Library> and never name the library directly. Only SCALE exists
// today (see scale/encoder.hpp).
template <typename Library>
struct encoder {
  template <typename T>
  veritas::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, veritas::schema::bytes_t& out);

  template <typename T>
  T decode(const veritas::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const veritas::schema::bytes_view_t& bytes);
};

}  // namespace veritas::schema::encoding
