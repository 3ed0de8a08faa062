#include <spdlog/spdlog.h>
#include <veritas/certificate/canonical_encoder.hpp>
#include <veritas/certificate/record_store.hpp>
#include <veritas/schema/key/record_keys.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace veritas::schema;

namespace veritas::certificate {

rocksdb_record_store::rocksdb_record_store(
    veritas::scale_encoder_t& encoder,
    veritas::storage::storage<veritas::storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder}, storage_{storage} {}

bool rocksdb_record_store::insert(const certificate_record_t& record,
                                  std::string& error) {
  const auto& institution_id = record.fields.institution_id;
  auto record_key = key::make_record_key(record.fingerprint);
  auto lookup_key = key::make_record_lookup_key(
      make_lookup_key(institution_id, record.fields.roll_number),
      record.fingerprint);
  auto count_key = key::make_institution_count_key(institution_id);

  auto lock = std::scoped_lock{mutex_};
  if (storage_.exists(record_key)) {
    error = "a record with fingerprint " + to_hex(record.fingerprint) +
            " already exists";
    return false;
  }

  auto count = storage_.get<uint64_t>(encoder_, count_key).value_or(0);
  storage_.commit_batch(
      std::vector<veritas::storage::key_value_entry_t>{
          {record_key, encoder_.encode(record)},
          {lookup_key, encoder_.encode(record.fingerprint)},
          {key::make_institution_record_key(institution_id, record.issued_at,
                                            record.fingerprint),
           encoder_.encode(record.fingerprint)},
          {count_key, encoder_.encode(count + 1)}},
      std::nullopt);
  spdlog::debug("Stored certificate record {}", to_hex(record.fingerprint));
  return true;
}

std::vector<certificate_record_t> rocksdb_record_store::find_by_lookup_key(
    const std::string_view& lookup_key) const {
  auto lock = std::scoped_lock{mutex_};
  return load_indexed(
      storage_.list_by_prefix(key::make_record_lookup_prefix(lookup_key)));
}

std::optional<certificate_record_t> rocksdb_record_store::find_by_fingerprint(
    const fingerprint_t& fingerprint) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<certificate_record_t>(encoder_,
                                            key::make_record_key(fingerprint));
}

void rocksdb_record_store::set_transaction_id(
    const fingerprint_t& fingerprint,
    const transaction_id_t& transaction_id) {
  auto lock = std::scoped_lock{mutex_};
  storage_.put(encoder_, key::make_record_transaction_key(fingerprint),
               transaction_id);
}

std::optional<transaction_id_t> rocksdb_record_store::transaction_id(
    const fingerprint_t& fingerprint) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<transaction_id_t>(
      encoder_, key::make_record_transaction_key(fingerprint));
}

std::optional<certificate_page_t> rocksdb_record_store::list_by_institution(
    const std::string_view& institution_id,
    uint32_t page,
    uint32_t limit,
    std::string& error) const {
  if (page < 1 || limit < 1 || limit > kMaxPageLimit) {
    error = "page must be >= 1 and limit must be between 1 and " +
            std::to_string(kMaxPageLimit);
    return std::nullopt;
  }

  auto prefix = key::make_institution_records_prefix(institution_id);
  auto offset = static_cast<size_t>(page - 1) * limit;

  auto lock = std::scoped_lock{mutex_};
  auto result = certificate_page_t{};
  result.page = page;
  result.limit = limit;
  result.total =
      storage_
          .get<uint64_t>(encoder_,
                         key::make_institution_count_key(institution_id))
          .value_or(0);
  auto records = load_indexed(storage_.list_range(
      prefix, veritas::storage::prefix_end(prefix), offset, limit));
  result.certificates.reserve(records.size());
  for (auto& record : records) {
    auto entry = listed_certificate_t{};
    entry.transaction_id = storage_.get<transaction_id_t>(
        encoder_, key::make_record_transaction_key(record.fingerprint));
    entry.record = std::move(record);
    result.certificates.push_back(std::move(entry));
  }
  return result;
}

std::vector<certificate_record_t> rocksdb_record_store::load_indexed(
    const std::vector<veritas::storage::key_value_entry_t>& index) const {
  auto records = std::vector<certificate_record_t>{};
  records.reserve(index.size());
  for (const auto& [key, value] : index) {
    auto fingerprint = encoder_.try_decode<fingerprint_t>(value);
    if (!fingerprint) {
      veritas::common::critical("failed to decode record index entry");
    }
    auto record = storage_.get<certificate_record_t>(
        encoder_, key::make_record_key(fingerprint.value()));
    if (!record) {
      veritas::common::critical("record index points at a missing record",
                                to_hex(fingerprint.value()));
    }
    records.push_back(std::move(record.value()));
  }
  return records;
}

}  // namespace veritas::certificate
