#pragma once
#include <veritas/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace veritas::storage {

using key_value_entry_t =
    std::pair<veritas::schema::bytes_t, veritas::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t height{};
  veritas::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const veritas::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const veritas::schema::bytes_view_t& key,
           const T& value) const;

  bool exists(const veritas::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const veritas::schema::bytes_view_t& prefix) const;

  /// Return key-value pairs with `first <= key < last` in key order,
  /// skipping `offset` entries and stopping after `limit`. An empty `last`
  /// means no upper bound.
  std::vector<key_value_entry_t> list_range(
      const veritas::schema::bytes_view_t& first,
      const veritas::schema::bytes_view_t& last,
      size_t offset,
      size_t limit) const;

  /// Atomically write all entries, and the checkpoint when provided.
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const std::optional<committed_state>& state) const;
};

/// Smallest key ordered after every key that starts with `prefix`; empty
/// when no such key exists (prefix of all 0xFF bytes).
inline veritas::schema::bytes_t prefix_end(
    const veritas::schema::bytes_view_t& prefix) {
  auto end = veritas::schema::bytes_t{prefix.begin(), prefix.end()};
  while (!end.empty()) {
    if (end.back() != 0xFF) {
      ++end.back();
      return end;
    }
    end.pop_back();
  }
  return end;
}

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace veritas::storage
