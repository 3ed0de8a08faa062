#pragma once
#include <veritas/schema/primitives.hpp>

// Schema type: hash added record.
// Audit log entry for each `HashAdded(bytes32 indexed)` emission, ordered by
// (height, index).
namespace veritas::schema {

template <uint16_t Version>
struct hash_added_record;

template <>
struct hash_added_record<1> final {
  uint16_t version{1};
  uint64_t height{};
  uint32_t index{};
  transaction_id_t transaction_id{};
  fingerprint_t fingerprint{};
};

using hash_added_record_t = hash_added_record<1>;

}  // namespace veritas::schema
