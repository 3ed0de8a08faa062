#include <veritas/common/critical.hpp>
#include <veritas/storage/rocksdb/storage.hpp>

namespace veritas::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    veritas::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::exists(
    const veritas::schema::bytes_view_t& key) const {
  if (!database) {
    veritas::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to read key from RocksDB: {}", status.ToString());
    veritas::common::critical("Failed to read key from RocksDB");
  }
  return true;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    veritas::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    veritas::common::critical("failed to load committed state",
                              committed_status.ToString());
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, veritas::schema::hash32_t>>(
          veritas::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    veritas::common::critical("failed to decode committed state");
  }
  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const veritas::schema::bytes_view_t& prefix) const {
  if (!database) {
    veritas::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    veritas::common::critical("failed iterating RocksDB prefix",
                              iterator->status().ToString());
  }
  return entries;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const veritas::schema::bytes_view_t& first,
    const veritas::schema::bytes_view_t& last,
    size_t offset,
    size_t limit) const {
  if (!database) {
    veritas::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  if (limit == 0) {
    return entries;
  }
  auto upper_bound = detail::to_slice(last);
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  if (!last.empty()) {
    read_options.iterate_upper_bound = &upper_bound;
  }
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  for (iterator->Seek(detail::to_slice(first));
       iterator->Valid() && entries.size() < limit; iterator->Next()) {
    if (offset > 0) {
      --offset;
      continue;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    veritas::common::critical("failed iterating RocksDB range",
                              iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries,
    const std::optional<committed_state>& state) const {
  if (!database) {
    veritas::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      veritas::common::critical("failed writing key into batch");
    }
  }

  if (state) {
    auto encoder = detail::encoder_t{};
    auto encoded = encoder.encode(std::tuple{state->height, state->state_root});
    auto state_status = batch.Put(std::string{detail::kCommittedStateKey},
                                  detail::to_slice(encoded));
    if (!state_status.ok()) {
      veritas::common::critical("failed writing committed state into batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch: {}", write_status.ToString());
    veritas::common::critical("failed to commit write batch");
  }
}

}  // namespace veritas::storage
