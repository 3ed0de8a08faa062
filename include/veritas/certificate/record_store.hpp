#pragma once

#include <veritas/schema/certificate_page.hpp>
#include <veritas/schema/certificate_record.hpp>
#include <veritas/schema/encoding/scale/encoder.hpp>
#include <veritas/schema/primitives.hpp>
#include <veritas/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veritas::certificate {

inline constexpr uint32_t kMaxPageLimit{100};

/// Off-chain certificate records. A record is written once at issuance and
/// never mutated; the registration transaction id lives in a side table.
class record_store {
 public:
  virtual ~record_store() = default;

  /// Persist a record. Fails, writing nothing, when the fingerprint is
  /// already stored. Several records may share one (institution, roll).
  virtual bool insert(const veritas::schema::certificate_record_t& record,
                      std::string& error) = 0;

  /// Every record issued under the lookup key, in fingerprint order.
  virtual std::vector<veritas::schema::certificate_record_t>
  find_by_lookup_key(const std::string_view& lookup_key) const = 0;

  virtual std::optional<veritas::schema::certificate_record_t>
  find_by_fingerprint(
      const veritas::schema::fingerprint_t& fingerprint) const = 0;

  virtual void set_transaction_id(
      const veritas::schema::fingerprint_t& fingerprint,
      const veritas::schema::transaction_id_t& transaction_id) = 0;

  virtual std::optional<veritas::schema::transaction_id_t> transaction_id(
      const veritas::schema::fingerprint_t& fingerprint) const = 0;

  /// Records issued by a (normalized) institution, newest first. `page`
  /// starts at 1 and `limit` must lie in [1, kMaxPageLimit].
  virtual std::optional<veritas::schema::certificate_page_t>
  list_by_institution(const std::string_view& institution_id,
                      uint32_t page,
                      uint32_t limit,
                      std::string& error) const = 0;
};

class rocksdb_record_store final : public record_store {
 public:
  rocksdb_record_store(
      veritas::scale_encoder_t& encoder,
      veritas::storage::storage<veritas::storage::rocksdb_storage_tag>&
          storage);

  bool insert(const veritas::schema::certificate_record_t& record,
              std::string& error) override;

  std::vector<veritas::schema::certificate_record_t> find_by_lookup_key(
      const std::string_view& lookup_key) const override;

  std::optional<veritas::schema::certificate_record_t> find_by_fingerprint(
      const veritas::schema::fingerprint_t& fingerprint) const override;

  void set_transaction_id(
      const veritas::schema::fingerprint_t& fingerprint,
      const veritas::schema::transaction_id_t& transaction_id) override;

  std::optional<veritas::schema::transaction_id_t> transaction_id(
      const veritas::schema::fingerprint_t& fingerprint) const override;

  std::optional<veritas::schema::certificate_page_t> list_by_institution(
      const std::string_view& institution_id,
      uint32_t page,
      uint32_t limit,
      std::string& error) const override;

 private:
  // Resolves index entries (fingerprint values) to records. Caller holds
  // mutex_.
  std::vector<veritas::schema::certificate_record_t> load_indexed(
      const std::vector<veritas::storage::key_value_entry_t>& index) const;

  mutable std::mutex mutex_;
  veritas::scale_encoder_t& encoder_;
  veritas::storage::storage<veritas::storage::rocksdb_storage_tag>& storage_;
};

}  // namespace veritas::certificate
