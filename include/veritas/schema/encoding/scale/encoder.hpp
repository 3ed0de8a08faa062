#pragma once
#include <veritas/common/critical.hpp>
#include <veritas/schema/encoding/encoder.hpp>
#include <veritas/schema/encoding/scale/account_state.hpp>
#include <veritas/schema/encoding/scale/add_certificate_hash.hpp>
#include <veritas/schema/encoding/scale/certificate_fields.hpp>
#include <veritas/schema/encoding/scale/certificate_record.hpp>
#include <veritas/schema/encoding/scale/genesis.hpp>
#include <veritas/schema/encoding/scale/hash_added_record.hpp>
#include <veritas/schema/encoding/scale/transaction.hpp>
#include <veritas/schema/encoding/scale/transaction_event.hpp>
#include <veritas/schema/encoding/scale/transaction_event_attribute.hpp>
#include <veritas/schema/encoding/scale/transaction_receipt.hpp>
#include <veritas/schema/encoding/scale/transaction_result.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace veritas::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  veritas::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, veritas::schema::bytes_t& out);

  template <typename T>
  T decode(const veritas::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const veritas::schema::bytes_view_t& bytes);
};

template <typename T>
veritas::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    veritas::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        veritas::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const veritas::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    veritas::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const veritas::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace veritas::schema::encoding

namespace veritas {

using scale_encoder_t = veritas::schema::encoding::encoder<
    veritas::schema::encoding::scale_encoder_tag>;

}  // namespace veritas
