#pragma once

#include <veritas/schema/key/builder.hpp>
#include <veritas/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Key layout of the registry node database.
namespace veritas::schema::key {

inline constexpr std::string_view kGenesisKey{"SYS|APP|GENESIS"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kVerifiedKeyPrefix{"SYS|STATE|VERIFIED|"};
inline constexpr std::string_view kReceiptKeyPrefix{"SYS|RECEIPT|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|HASH_ADDED|"};

template <typename Encoder, typename T>
veritas::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
veritas::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
veritas::schema::bytes_t make_genesis_key(Encoder& encoder) {
  return make_prefix_key(encoder, kGenesisKey);
}

template <typename Encoder>
veritas::schema::bytes_t make_account_key(
    Encoder& encoder,
    const veritas::schema::public_key_t& signer) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, signer);
}

template <typename Encoder>
veritas::schema::bytes_t make_verified_key(
    Encoder& encoder,
    const veritas::schema::fingerprint_t& fingerprint) {
  return make_prefixed_key(encoder, kVerifiedKeyPrefix, fingerprint);
}

template <typename Encoder>
veritas::schema::bytes_t make_receipt_key(
    Encoder& encoder,
    const veritas::schema::transaction_id_t& transaction_id) {
  return make_prefixed_key(encoder, kReceiptKeyPrefix, transaction_id);
}

// Events are scanned by height range, so the position is written raw.
inline veritas::schema::bytes_t make_event_key(uint64_t height,
                                               uint32_t index) {
  auto key = builder{};
  key.write(kEventPrefix).write(height).write(index);
  return key.data;
}

/// Prefix shared by every event emitted at `height`.
inline veritas::schema::bytes_t make_event_height_key(uint64_t height) {
  auto key = builder{};
  key.write(kEventPrefix).write(height);
  return key.data;
}

inline veritas::schema::bytes_t make_event_prefix_key() {
  auto key = builder{};
  key.write(kEventPrefix);
  return key.data;
}

}  // namespace veritas::schema::key
