#include <spdlog/spdlog.h>
#include <veritas/chain/grpc_client.hpp>
#include <veritas/registry/transaction_signing.hpp>
#include <veritas/schema/transaction.hpp>
#include <veritas/schema/transaction_error_code.hpp>
#include <thread>
#include <utility>

using namespace veritas::schema;

namespace {

chain_error_code map_status(const grpc::Status& status) {
  switch (status.error_code()) {
    case grpc::StatusCode::UNAVAILABLE:
      return chain_error_code::network_unavailable;
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return chain_error_code::timeout;
    default:
      return chain_error_code::rejected;
  }
}

std::string describe(const grpc::Status& status) {
  return "gRPC status " + std::to_string(status.error_code()) + ": " +
         status.error_message();
}

/// Classify a non-zero admission or execution code.
chain_error_code map_result_code(uint32_t code) {
  if (code == to_code(transaction_error_code::duplicate_entry)) {
    return chain_error_code::duplicate_entry;
  }
  if (code == to_code(transaction_error_code::insufficient_funds)) {
    return chain_error_code::insufficient_funds;
  }
  if (code == to_code(transaction_error_code::not_owner)) {
    return chain_error_code::not_owner;
  }
  return chain_error_code::rejected;
}

void log_chain_error(chain_error_code error, const std::string& message) {
  switch (error) {
    case chain_error_code::duplicate_entry:
      spdlog::info("Fingerprint already registered on chain: {}", message);
      break;
    case chain_error_code::insufficient_funds:
      spdlog::error("Registry account cannot pay for gas: {}", message);
      break;
    default:
      spdlog::warn("Chain registration failed ({}): {}", to_string(error),
                   message);
      break;
  }
}

}  // namespace

namespace veritas::chain {

grpc_client::grpc_client(std::shared_ptr<grpc::ChannelInterface> channel,
                         veritas::crypto::signing_key key,
                         grpc_client_options options)
    : stub_{veritas::registry::v1::Registry::NewStub(std::move(channel))},
      key_{std::move(key)},
      options_{options} {}

register_result grpc_client::register_fingerprint(
    const fingerprint_t& fingerprint) {
  auto result = register_result{};
  for (auto attempt = uint32_t{0};; ++attempt) {
    auto sync_error = synchronize(result.message);
    if (sync_error) {
      result.error = sync_error;
      log_chain_error(*sync_error, result.message);
      return result;
    }

    auto submitted = submit(fingerprint);
    if (submitted.transaction_id) {
      return wait_for_receipt(*submitted.transaction_id);
    }

    nonce_synced_ = false;
    result.message = submitted.message;
    if (submitted.error) {
      result.error = submitted.error;
      log_chain_error(*submitted.error, result.message);
      return result;
    }
    if (submitted.code == to_code(transaction_error_code::invalid_nonce) &&
        attempt < options_.max_nonce_retries) {
      spdlog::debug("Nonce out of sync ({}); retrying", submitted.message);
      continue;
    }
    result.error = map_result_code(submitted.code.value_or(0));
    log_chain_error(*result.error, result.message);
    return result;
  }
}

verify_result grpc_client::verify(const fingerprint_t& fingerprint) {
  auto result = verify_result{};
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto request = veritas::registry::v1::IsVerifiedRequest{};
  request.set_fingerprint(make_string(fingerprint));
  auto response = veritas::registry::v1::IsVerifiedResponse{};
  auto status = stub_->IsVerified(&context, request, &response);
  if (!status.ok()) {
    result.error = map_status(status);
    result.message = describe(status);
    spdlog::warn("isVerified call failed: {}", result.message);
    return result;
  }
  result.verified = response.verified();
  return result;
}

std::optional<chain_error_code> grpc_client::synchronize(std::string& message) {
  auto lock = std::scoped_lock{sync_mutex_};
  if (!chain_id_) {
    auto context = grpc::ClientContext{};
    set_deadline(context);
    auto response = veritas::registry::v1::GetInfoResponse{};
    auto status = stub_->GetInfo(
        &context, veritas::registry::v1::GetInfoRequest{}, &response);
    if (!status.ok()) {
      message = describe(status);
      return map_status(status);
    }
    auto chain_id = try_make_hash32(make_bytes_view(response.chain_id()));
    if (!chain_id) {
      message = "registry returned a malformed chain id";
      return chain_error_code::rejected;
    }
    chain_id_ = chain_id;
    spdlog::info("Connected to registry chain {} at height {}",
                 to_hex(*chain_id_), response.last_block_height());
  }

  if (!nonce_synced_) {
    auto context = grpc::ClientContext{};
    set_deadline(context);
    auto request = veritas::registry::v1::GetAccountRequest{};
    request.set_public_key(make_string(key_.public_key()));
    auto response = veritas::registry::v1::GetAccountResponse{};
    auto status = stub_->GetAccount(&context, request, &response);
    if (!status.ok()) {
      message = describe(status);
      return map_status(status);
    }
    next_nonce_ = response.pending_nonce();
    nonce_synced_ = true;
  }
  return std::nullopt;
}

grpc_client::submission grpc_client::submit(const fingerprint_t& fingerprint) {
  auto tx = transaction_t{};
  {
    auto lock = std::scoped_lock{sync_mutex_};
    tx.chain_id = chain_id_.value();
  }
  tx.nonce = next_nonce_.fetch_add(1);
  tx.payload.fingerprint = fingerprint;
  veritas::registry::sign_transaction(encoder_, key_, tx);
  auto raw = encoder_.encode(tx);

  auto out = submission{};
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto request = veritas::registry::v1::SubmitTransactionRequest{};
  request.set_tx(make_string(raw));
  auto response = veritas::registry::v1::SubmitTransactionResponse{};
  auto status = stub_->SubmitTransaction(&context, request, &response);
  if (!status.ok()) {
    out.error = map_status(status);
    out.message = describe(status);
    return out;
  }

  const auto& submitted = response.result();
  if (submitted.code() != 0) {
    out.code = submitted.code();
    out.message = submitted.log();
    if (!submitted.info().empty()) {
      out.message += " (" + submitted.info() + ")";
    }
    return out;
  }
  out.transaction_id =
      try_make_hash32(make_bytes_view(response.transaction_id()));
  if (!out.transaction_id) {
    out.error = chain_error_code::rejected;
    out.message = "registry returned a malformed transaction id";
    return out;
  }
  spdlog::debug("Submitted transaction {} with nonce {}",
                to_hex(*out.transaction_id), tx.nonce);
  return out;
}

register_result grpc_client::wait_for_receipt(
    const transaction_id_t& transaction_id) {
  auto result = register_result{};
  auto deadline =
      std::chrono::steady_clock::now() + options_.confirmation_timeout;
  auto last_failure = std::optional<grpc::Status>{};

  while (std::chrono::steady_clock::now() < deadline) {
    auto context = grpc::ClientContext{};
    set_deadline(context);
    auto request = veritas::registry::v1::GetReceiptRequest{};
    request.set_transaction_id(make_string(transaction_id));
    auto response = veritas::registry::v1::GetReceiptResponse{};
    auto status = stub_->GetReceipt(&context, request, &response);
    if (!status.ok()) {
      last_failure = status;
    } else if (response.status() ==
               veritas::registry::v1::GetReceiptResponse::CONFIRMED) {
      result.transaction_id = transaction_id;
      const auto& executed = response.result();
      if (executed.code() != 0) {
        result.error = map_result_code(executed.code());
        result.message = executed.log();
        log_chain_error(*result.error, result.message);
      } else {
        spdlog::info("Fingerprint registered in block {} (tx {})",
                     response.height(), to_hex(transaction_id));
      }
      return result;
    } else {
      last_failure.reset();
    }
    std::this_thread::sleep_for(options_.receipt_poll_interval);
  }

  // The transaction may still land; the nonce cursor cannot be trusted.
  nonce_synced_ = false;
  if (last_failure &&
      map_status(*last_failure) == chain_error_code::network_unavailable) {
    result.error = chain_error_code::network_unavailable;
    result.message = describe(*last_failure);
  } else {
    result.error = chain_error_code::timeout;
    result.message = "transaction " + to_hex(transaction_id) +
                     " not confirmed within " +
                     std::to_string(options_.confirmation_timeout.count()) +
                     " ms";
  }
  log_chain_error(*result.error, result.message);
  return result;
}

void grpc_client::set_deadline(grpc::ClientContext& context) const {
  context.set_deadline(std::chrono::system_clock::now() + options_.rpc_timeout);
}

}  // namespace veritas::chain
