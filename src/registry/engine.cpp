#include <spdlog/spdlog.h>
#include <veritas/blake3/hash.hpp>
#include <veritas/common/critical.hpp>
#include <veritas/registry/contract.hpp>
#include <veritas/registry/engine.hpp>
#include <veritas/registry/transaction_signing.hpp>
#include <veritas/schema/key/registry_keys.hpp>
#include <veritas/schema/transaction_error_code.hpp>
#include <iterator>
#include <limits>
#include <string>
#include <tuple>
#include <utility>

using namespace veritas::schema;

namespace {

using storage_t =
    veritas::storage::storage<veritas::storage::rocksdb_storage_tag>;

/// Registry state as of the last committed block. Used for admission
/// dry-runs, so writes are discarded.
struct committed_view final {
  const storage_t& storage;
  veritas::scale_encoder_t& encoder;

  bool is_verified(const fingerprint_t& fingerprint) const {
    return storage.exists(
        veritas::schema::key::make_verified_key(encoder, fingerprint));
  }

  void mark_verified(const fingerprint_t&) {}
};

/// Registry writes staged by the block being produced.
struct block_overlay final {
  const storage_t& storage;
  veritas::scale_encoder_t& encoder;
  std::set<fingerprint_t> verified;

  bool is_verified(const fingerprint_t& fingerprint) const {
    return verified.contains(fingerprint) ||
           storage.exists(
               veritas::schema::key::make_verified_key(encoder, fingerprint));
  }

  void mark_verified(const fingerprint_t& fingerprint) {
    verified.insert(fingerprint);
  }
};

std::optional<amount_t> gas_cost(int64_t gas, amount_t gas_price) {
  auto units = static_cast<amount_t>(gas);
  if (gas_price != 0 &&
      units > std::numeric_limits<amount_t>::max() / gas_price) {
    return std::nullopt;
  }
  return units * gas_price;
}

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint32_t index,
                         uint32_t code) {
  auto encoder = veritas::scale_encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index, code});
  return veritas::blake3::hasher{}
      .update(seed)
      .update(tx)
      .update(encoded_suffix)
      .finalize();
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string_view codespace,
                                       std::string log,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = to_code(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

template <typename T>
veritas::storage::key_value_entry_t make_entry(
    veritas::scale_encoder_t& encoder,
    bytes_t key,
    const T& value) {
  return veritas::storage::key_value_entry_t{std::move(key),
                                             encoder.encode(value)};
}

}  // namespace

namespace veritas::registry {

engine::engine(veritas::scale_encoder_t& encoder,
               veritas::storage::storage<veritas::storage::rocksdb_storage_tag>&
                   storage,
               const veritas::schema::genesis_t& genesis,
               std::size_t max_pending_transactions)
    : encoder_{encoder},
      storage_{storage},
      max_pending_transactions_{max_pending_transactions} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state(genesis);
  spdlog::info("Registry engine ready at height {} (chain {}, owner {})",
               last_committed_height_, to_hex(genesis_.chain_id),
               to_hex(genesis_.owner));
}

transaction_result_t engine::submit_transaction(const bytes_view_t& raw_tx) {
  auto maybe_tx = std::optional<transaction_t>{};
  if (!raw_tx.empty()) {
    maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  }
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             kSubmitCodespace, "invalid transaction",
                             raw_tx.empty() ? "empty transaction"
                                            : "failed to decode transaction");
  }
  const auto& tx = maybe_tx.value();

  auto validation = validate_transaction(tx);
  if (validation.code != 0) {
    spdlog::debug("Rejected transaction: {}", validation.log);
    return validation;
  }

  auto id = make_transaction_id(raw_tx);

  auto lock = std::scoped_lock{mutex_};
  if (mempool_.size() >= max_pending_transactions_) {
    return make_error_result(transaction_error_code::mempool_full,
                             kSubmitCodespace, "transaction queue is full");
  }

  auto account = load_account(tx.signer);
  auto queued = uint64_t{};
  if (auto it = pending_nonces_.find(tx.signer);
      it != std::end(pending_nonces_)) {
    queued = it->second;
  }
  auto expected_nonce = account.nonce + queued;
  if (tx.nonce != expected_nonce) {
    return make_error_result(
        transaction_error_code::invalid_nonce, kSubmitCodespace,
        "invalid nonce", "expected nonce " + std::to_string(expected_nonce));
  }

  // Mirrors a gas estimate: a call that would revert against committed state
  // is refused before it costs anything.
  auto view = committed_view{storage_, encoder_};
  auto dry_run = contract<committed_view>{view, genesis_.owner};
  auto estimate = dry_run.add_certificate_hash(tx.signer, tx.payload);
  if (estimate.code != 0) {
    estimate.events.clear();
    estimate.gas_used = 0;
    spdlog::debug("Transaction {} would revert: {}", to_hex(id), estimate.log);
    return estimate;
  }

  auto fee = gas_cost(kAddCertificateHashGas, genesis_.gas_price);
  auto spend = amount_t{};
  if (auto it = pending_spend_.find(tx.signer);
      it != std::end(pending_spend_)) {
    spend = it->second;
  }
  if (!fee || account.balance < spend ||
      account.balance - spend < fee.value()) {
    return make_error_result(
        transaction_error_code::insufficient_funds, kSubmitCodespace,
        "insufficient funds for gas",
        "balance " + std::to_string(account.balance) + ", queued spend " +
            std::to_string(spend));
  }

  mempool_.push_back(pending_transaction{
      .id = id, .tx = tx, .raw = make_bytes(raw_tx)});
  pending_ids_.insert(id);
  pending_nonces_[tx.signer] = queued + 1;
  pending_spend_[tx.signer] = spend + fee.value();

  auto result = transaction_result_t{};
  result.code = 0;
  result.data = bytes_t(std::begin(id), std::end(id));
  result.gas_wanted = kAddCertificateHashGas;
  result.codespace = std::string{kSubmitCodespace};
  spdlog::debug("Queued transaction {} (nonce {})", to_hex(id), tx.nonce);
  return result;
}

std::optional<block_result_t> engine::produce_block() {
  auto lock = std::scoped_lock{mutex_};
  if (mempool_.empty()) {
    return std::nullopt;
  }

  auto height = last_committed_height_ + 1;
  auto result = block_result_t{};
  result.height = height;
  result.receipts.reserve(mempool_.size());

  auto overlay = block_overlay{storage_, encoder_, {}};
  auto registry = contract<block_overlay>{overlay, genesis_.owner};
  auto accounts = std::map<public_key_t, account_state_t>{};
  auto entries = std::vector<veritas::storage::key_value_entry_t>{};
  auto state_root = last_committed_state_root_;
  auto added = size_t{};

  auto index = uint32_t{};
  for (const auto& pending : mempool_) {
    auto [it, inserted] = accounts.try_emplace(pending.tx.signer);
    if (inserted) {
      it->second = load_account(pending.tx.signer);
    }
    auto& account = it->second;

    auto tx_result = transaction_result_t{};
    auto fee = gas_cost(kAddCertificateHashGas, genesis_.gas_price);
    if (pending.tx.nonce != account.nonce) {
      tx_result = make_error_result(
          transaction_error_code::invalid_nonce, kExecuteCodespace,
          "invalid nonce",
          "expected nonce " + std::to_string(account.nonce));
    } else if (!fee || account.balance < fee.value()) {
      tx_result =
          make_error_result(transaction_error_code::insufficient_funds,
                            kExecuteCodespace, "insufficient funds for gas");
    } else {
      tx_result = registry.add_certificate_hash(pending.tx.signer,
                                                pending.tx.payload);
      account.nonce += 1;
      account.balance -= fee.value();
    }

    auto receipt = transaction_receipt_t{};
    receipt.transaction_id = pending.id;
    receipt.height = height;
    receipt.index = index;
    receipt.result = std::move(tx_result);

    if (receipt.result.code == 0) {
      auto record = hash_added_record_t{};
      record.height = height;
      record.index = index;
      record.transaction_id = pending.id;
      record.fingerprint = pending.tx.payload.fingerprint;
      entries.push_back(make_entry(
          encoder_, veritas::schema::key::make_event_key(height, index),
          record));
      ++added;
    } else {
      spdlog::info("Transaction {} reverted: {}", to_hex(pending.id),
                   receipt.result.log);
    }

    entries.push_back(make_entry(
        encoder_, veritas::schema::key::make_receipt_key(encoder_, pending.id),
        receipt));
    state_root = fold_state_root(state_root, pending.raw, height, index,
                                 receipt.result.code);
    result.receipts.push_back(std::move(receipt));
    ++index;
  }

  for (const auto& [signer, account] : accounts) {
    entries.push_back(make_entry(
        encoder_, veritas::schema::key::make_account_key(encoder_, signer),
        account));
  }
  for (const auto& fingerprint : overlay.verified) {
    entries.push_back(make_entry(
        encoder_,
        veritas::schema::key::make_verified_key(encoder_, fingerprint), true));
  }

  storage_.commit_batch(
      entries, veritas::storage::committed_state{.height = height,
                                                 .state_root = state_root});

  last_committed_height_ = height;
  last_committed_state_root_ = state_root;
  result.state_root = state_root;
  mempool_.clear();
  pending_ids_.clear();
  pending_nonces_.clear();
  pending_spend_.clear();

  spdlog::info("Produced block {} with {} transaction(s), {} hash(es) added",
               height, result.receipts.size(), added);
  return result;
}

std::size_t engine::pending_count() const {
  auto lock = std::scoped_lock{mutex_};
  return mempool_.size();
}

bool engine::is_verified(const fingerprint_t& fingerprint) const {
  auto lock = std::scoped_lock{mutex_};
  auto view = committed_view{storage_, encoder_};
  return contract<committed_view>{view, genesis_.owner}.is_verified(
      fingerprint);
}

receipt_query_t engine::receipt(const transaction_id_t& transaction_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto query = receipt_query_t{};
  if (pending_ids_.contains(transaction_id)) {
    query.status = receipt_status_t::pending;
    return query;
  }
  query.receipt = storage_.get<transaction_receipt_t>(
      encoder_,
      veritas::schema::key::make_receipt_key(encoder_, transaction_id));
  query.status = query.receipt ? receipt_status_t::confirmed
                               : receipt_status_t::unknown;
  return query;
}

account_info_t engine::account(const public_key_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = load_account(signer);
  auto info = account_info_t{};
  info.nonce = state.nonce;
  info.pending_nonce = state.nonce;
  info.balance = state.balance;
  if (auto it = pending_nonces_.find(signer); it != std::end(pending_nonces_)) {
    info.pending_nonce += it->second;
  }
  if (auto it = pending_spend_.find(signer); it != std::end(pending_spend_)) {
    info.pending_spend = it->second;
  }
  return info;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.chain_id = genesis_.chain_id;
  result.owner = genesis_.owner;
  result.gas_price = genesis_.gas_price;
  return result;
}

std::vector<hash_added_record_t> engine::events(uint64_t from_height,
                                                uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<hash_added_record_t>{};
  if (from_height > to_height) {
    return records;
  }
  auto first = veritas::schema::key::make_event_key(from_height, 0);
  auto last = veritas::storage::prefix_end(
      veritas::schema::key::make_event_height_key(to_height));
  auto entries = storage_.list_range(first, last, 0,
                                     std::numeric_limits<size_t>::max());
  records.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    auto record = encoder_.try_decode<hash_added_record_t>(value);
    if (!record) {
      veritas::common::critical("failed to decode stored HashAdded event");
    }
    records.push_back(std::move(record.value()));
  }
  return records;
}

const genesis_t& engine::genesis() const {
  return genesis_;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        kSubmitCodespace, "unsupported transaction version",
        "expected version 1");
  }
  if (tx.chain_id != genesis_.chain_id) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             kSubmitCodespace, "invalid chain id",
                             "expected " + to_hex(genesis_.chain_id));
  }
  if (!verify_transaction_signature(encoder_, tx)) {
    return make_error_result(
        transaction_error_code::signature_verification_failed,
        kSubmitCodespace, "signature verification failed");
  }
  return transaction_result_t{};
}

account_state_t engine::load_account(const public_key_t& signer) const {
  auto stored = storage_.get<account_state_t>(
      encoder_, veritas::schema::key::make_account_key(encoder_, signer));
  return stored.value_or(account_state_t{});
}

void engine::load_persisted_state(const genesis_t& genesis) {
  auto genesis_key = veritas::schema::key::make_genesis_key(encoder_);
  if (auto stored = storage_.get<genesis_t>(encoder_, genesis_key)) {
    genesis_ = stored.value();
    if (genesis_.chain_id != genesis.chain_id ||
        genesis_.owner != genesis.owner ||
        genesis_.owner_balance != genesis.owner_balance ||
        genesis_.gas_price != genesis.gas_price) {
      spdlog::warn(
          "Configured genesis differs from the stored genesis; keeping the "
          "stored one");
    }
    auto committed = storage_.load_committed_state();
    if (!committed) {
      veritas::common::critical("genesis present without committed state");
    }
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    return;
  }

  genesis_ = genesis;
  auto owner = account_state_t{};
  owner.balance = genesis.owner_balance;
  auto entries = std::vector<veritas::storage::key_value_entry_t>{
      make_entry(encoder_, genesis_key, genesis_),
      make_entry(
          encoder_,
          veritas::schema::key::make_account_key(encoder_, genesis.owner),
          owner)};
  last_committed_height_ = 0;
  last_committed_state_root_ = make_zero_hash();
  storage_.commit_batch(entries,
                        veritas::storage::committed_state{
                            .height = last_committed_height_,
                            .state_root = last_committed_state_root_});
  spdlog::info("Wrote genesis: owner balance {}, gas price {}",
               genesis.owner_balance, genesis.gas_price);
}

}  // namespace veritas::registry
