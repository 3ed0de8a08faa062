#pragma once

#include <veritas/schema/key/builder.hpp>
#include <veritas/schema/primitives.hpp>
#include <cstdint>
#include <limits>
#include <string_view>

// Key layout of the local certificate record store.
namespace veritas::schema::key {

inline constexpr std::string_view kRecordByFingerprintPrefix{"REC|FP|"};
inline constexpr std::string_view kRecordByLookupKeyPrefix{"REC|KEY|"};
inline constexpr std::string_view kRecordTransactionPrefix{"REC|TX|"};
inline constexpr std::string_view kRecordByInstitutionPrefix{"REC|INST|"};
inline constexpr std::string_view kRecordCountPrefix{"REC|COUNT|"};

inline veritas::schema::bytes_t make_record_key(
    const veritas::schema::fingerprint_t& fingerprint) {
  auto key = builder{};
  key.write(kRecordByFingerprintPrefix).write(fingerprint);
  return key.data;
}

/// Only the BLAKE3 digest of the (institution, roll) lookup key is stored.
/// One index entry per fingerprint sits under this prefix.
inline veritas::schema::bytes_t make_record_lookup_prefix(
    const std::string_view& lookup_key) {
  auto key = builder{};
  key.write(kRecordByLookupKeyPrefix).hash(lookup_key);
  return key.data;
}

inline veritas::schema::bytes_t make_record_lookup_key(
    const std::string_view& lookup_key,
    const veritas::schema::fingerprint_t& fingerprint) {
  auto key = builder{};
  key.write(make_record_lookup_prefix(lookup_key)).write(fingerprint);
  return key.data;
}

inline veritas::schema::bytes_t make_institution_records_prefix(
    const std::string_view& institution_id) {
  auto key = builder{};
  key.write(kRecordByInstitutionPrefix).hash(institution_id);
  return key.data;
}

// The issue time is stored inverted so that key order is newest first.
inline veritas::schema::bytes_t make_institution_record_key(
    const std::string_view& institution_id,
    const veritas::schema::timestamp_milliseconds_t issued_at,
    const veritas::schema::fingerprint_t& fingerprint) {
  auto key = builder{};
  key.write(make_institution_records_prefix(institution_id))
      .write(std::numeric_limits<uint64_t>::max() -
             static_cast<uint64_t>(issued_at))
      .write(fingerprint);
  return key.data;
}

inline veritas::schema::bytes_t make_institution_count_key(
    const std::string_view& institution_id) {
  auto key = builder{};
  key.write(kRecordCountPrefix).hash(institution_id);
  return key.data;
}

inline veritas::schema::bytes_t make_record_transaction_key(
    const veritas::schema::fingerprint_t& fingerprint) {
  auto key = builder{};
  key.write(kRecordTransactionPrefix).write(fingerprint);
  return key.data;
}

}  // namespace veritas::schema::key
