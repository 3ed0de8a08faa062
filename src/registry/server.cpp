#include <spdlog/spdlog.h>
#include <veritas/registry/server.hpp>
#include <optional>
#include <string>

using namespace veritas::registry;
using namespace veritas::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_invalid_argument(
    grpc::CallbackServerContext* context,
    const std::string& message) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
  return reactor;
}

std::optional<hash32_t> read_hash32(const std::string& value) {
  return veritas::schema::try_make_hash32(make_bytes_view(value));
}

void populate_transaction_result(
    const transaction_result_t& source,
    veritas::registry::v1::TransactionResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out_event = destination->add_events();
    out_event->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out_event->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

veritas::registry::v1::GetReceiptResponse::Status map_receipt_status(
    receipt_status_t status) {
  using enum receipt_status_t;
  switch (status) {
    case pending:
      return veritas::registry::v1::GetReceiptResponse::PENDING;
    case confirmed:
      return veritas::registry::v1::GetReceiptResponse::CONFIRMED;
    case unknown:
    default:
      return veritas::registry::v1::GetReceiptResponse::UNKNOWN;
  }
}

}  // namespace

listener::listener(veritas::registry::engine& engine)
    : registry_engine_{engine} {}

grpc::ServerUnaryReactor* listener::SubmitTransaction(
    grpc::CallbackServerContext* context,
    const veritas::registry::v1::SubmitTransactionRequest* request,
    veritas::registry::v1::SubmitTransactionResponse* response) {
  auto tx = make_bytes(request->tx());
  auto result = registry_engine_.submit_transaction(tx);
  if (result.code == 0) {
    response->set_transaction_id(make_string(result.data));
  }
  populate_transaction_result(result, response->mutable_result());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetReceipt(
    grpc::CallbackServerContext* context,
    const veritas::registry::v1::GetReceiptRequest* request,
    veritas::registry::v1::GetReceiptResponse* response) {
  auto transaction_id = read_hash32(request->transaction_id());
  if (!transaction_id) {
    return finish_invalid_argument(context,
                                   "transaction_id must be 32 bytes");
  }
  auto query = registry_engine_.receipt(*transaction_id);
  response->set_status(map_receipt_status(query.status));
  if (query.receipt) {
    response->set_height(query.receipt->height);
    response->set_index(query.receipt->index);
    populate_transaction_result(query.receipt->result,
                                response->mutable_result());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::IsVerified(
    grpc::CallbackServerContext* context,
    const veritas::registry::v1::IsVerifiedRequest* request,
    veritas::registry::v1::IsVerifiedResponse* response) {
  auto fingerprint = read_hash32(request->fingerprint());
  if (!fingerprint) {
    return finish_invalid_argument(context, "fingerprint must be 32 bytes");
  }
  response->set_verified(registry_engine_.is_verified(*fingerprint));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetAccount(
    grpc::CallbackServerContext* context,
    const veritas::registry::v1::GetAccountRequest* request,
    veritas::registry::v1::GetAccountResponse* response) {
  auto public_key = read_hash32(request->public_key());
  if (!public_key) {
    return finish_invalid_argument(context, "public_key must be 32 bytes");
  }
  auto account = registry_engine_.account(*public_key);
  response->set_nonce(account.nonce);
  response->set_pending_nonce(account.pending_nonce);
  response->set_balance(account.balance);
  response->set_pending_spend(account.pending_spend);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetInfo(
    grpc::CallbackServerContext* context,
    const veritas::registry::v1::GetInfoRequest* /*request*/,
    veritas::registry::v1::GetInfoResponse* response) {
  auto info = registry_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(make_string(info.last_block_state_root));
  response->set_chain_id(make_string(info.chain_id));
  response->set_owner(make_string(info.owner));
  response->set_gas_price(info.gas_price);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListEvents(
    grpc::CallbackServerContext* context,
    const veritas::registry::v1::ListEventsRequest* request,
    veritas::registry::v1::ListEventsResponse* response) {
  auto events =
      registry_engine_.events(request->from_height(), request->to_height());
  for (const auto& event : events) {
    auto* out = response->add_events();
    out->set_height(event.height);
    out->set_index(event.index);
    out->set_transaction_id(make_string(event.transaction_id));
    out->set_fingerprint(make_string(event.fingerprint));
  }
  return finish_ok(context);
}
