#pragma once

#include <veritas/schema/account_state.hpp>
#include <veritas/schema/app_info.hpp>
#include <veritas/schema/block_result.hpp>
#include <veritas/schema/encoding/scale/encoder.hpp>
#include <veritas/schema/genesis.hpp>
#include <veritas/schema/hash_added_record.hpp>
#include <veritas/schema/primitives.hpp>
#include <veritas/schema/transaction.hpp>
#include <veritas/schema/transaction_receipt.hpp>
#include <veritas/schema/transaction_result.hpp>
#include <veritas/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace veritas::registry {

inline constexpr auto kSubmitCodespace = std::string_view{"veritas.submit"};
inline constexpr auto kExecuteCodespace = std::string_view{"veritas.execute"};

/// Single-operator chain hosting the certificate hash registry.
///
/// Transactions are admitted into a FIFO queue (`submit_transaction`) and
/// executed in order by `produce_block`, which commits accounts, registry
/// entries, receipts, `HashAdded` events and the new state root in one
/// storage batch. Admission and execution are serialized under one mutex.
class engine final {
 public:
  /// Open the chain. On an empty database `genesis` is written; otherwise the
  /// stored genesis wins and a differing `genesis` is only logged.
  engine(veritas::scale_encoder_t& encoder,
         veritas::storage::storage<veritas::storage::rocksdb_storage_tag>&
             storage,
         const veritas::schema::genesis_t& genesis,
         std::size_t max_pending_transactions = 10'000);

  /// Admit a transaction into the queue. Checks decode, version, chain id,
  /// signature, nonce (committed + queued), funds (including queued spend)
  /// and dry-runs the contract call against committed state. A non-zero
  /// `code` means rejection with no state change. On success `data` holds
  /// the transaction id.
  veritas::schema::transaction_result_t submit_transaction(
      const veritas::schema::bytes_view_t& raw_tx);

  /// Execute every queued transaction as the next block. Returns
  /// std::nullopt without advancing the height when nothing is queued.
  std::optional<veritas::schema::block_result_t> produce_block();

  std::size_t pending_count() const;

  /// `isVerified(bytes32)` against committed state.
  bool is_verified(const veritas::schema::fingerprint_t& fingerprint) const;

  veritas::schema::receipt_query_t receipt(
      const veritas::schema::transaction_id_t& transaction_id) const;

  veritas::schema::account_info_t account(
      const veritas::schema::public_key_t& signer) const;

  veritas::schema::app_info_t info() const;

  /// `HashAdded` audit log for blocks in the inclusive height range.
  std::vector<veritas::schema::hash_added_record_t> events(
      uint64_t from_height,
      uint64_t to_height) const;

  const veritas::schema::genesis_t& genesis() const;

 private:
  struct pending_transaction final {
    veritas::schema::transaction_id_t id{};
    veritas::schema::transaction_t tx;
    veritas::schema::bytes_t raw;
  };

  veritas::schema::transaction_result_t validate_transaction(
      const veritas::schema::transaction_t& tx) const;
  veritas::schema::account_state_t load_account(
      const veritas::schema::public_key_t& signer) const;
  void load_persisted_state(const veritas::schema::genesis_t& genesis);

  mutable std::mutex mutex_;
  veritas::scale_encoder_t& encoder_;
  veritas::storage::storage<veritas::storage::rocksdb_storage_tag>& storage_;
  veritas::schema::genesis_t genesis_;
  std::size_t max_pending_transactions_{};
  uint64_t last_committed_height_{};
  veritas::schema::hash32_t last_committed_state_root_{};
  std::deque<pending_transaction> mempool_;
  std::set<veritas::schema::transaction_id_t> pending_ids_;
  std::map<veritas::schema::public_key_t, uint64_t> pending_nonces_;
  std::map<veritas::schema::public_key_t, veritas::schema::amount_t>
      pending_spend_;
};

}  // namespace veritas::registry
