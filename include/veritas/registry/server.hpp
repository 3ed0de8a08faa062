#pragma once

#include <veritas/registry/engine.hpp>
#include <veritas/registry/v1/registry.grpc.pb.h>

namespace veritas::registry {

/// Callback gRPC listener exposing the registry engine.
///
/// Quick reference:
/// - SubmitTransaction: queue admission; rejections come back as a non-zero
///   result code with an OK status.
/// - GetReceipt: unknown, pending or confirmed (with the receipt).
/// - IsVerified: `isVerified(bytes32)` against committed state.
/// - GetAccount/GetInfo: nonce and balance, chain id, owner, gas price.
/// - ListEvents: `HashAdded` audit log by height range.
/// Malformed identifiers (not exactly 32 bytes) fail with INVALID_ARGUMENT.
struct listener final
    : public veritas::registry::v1::Registry::CallbackService {
  explicit listener(veritas::registry::engine& engine);

  virtual grpc::ServerUnaryReactor* SubmitTransaction(
      grpc::CallbackServerContext* context,
      const veritas::registry::v1::SubmitTransactionRequest* request,
      veritas::registry::v1::SubmitTransactionResponse* response)
      override final;

  virtual grpc::ServerUnaryReactor* GetReceipt(
      grpc::CallbackServerContext* context,
      const veritas::registry::v1::GetReceiptRequest* request,
      veritas::registry::v1::GetReceiptResponse* response) override final;

  virtual grpc::ServerUnaryReactor* IsVerified(
      grpc::CallbackServerContext* context,
      const veritas::registry::v1::IsVerifiedRequest* request,
      veritas::registry::v1::IsVerifiedResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetAccount(
      grpc::CallbackServerContext* context,
      const veritas::registry::v1::GetAccountRequest* request,
      veritas::registry::v1::GetAccountResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetInfo(
      grpc::CallbackServerContext* context,
      const veritas::registry::v1::GetInfoRequest* request,
      veritas::registry::v1::GetInfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListEvents(
      grpc::CallbackServerContext* context,
      const veritas::registry::v1::ListEventsRequest* request,
      veritas::registry::v1::ListEventsResponse* response) override final;

  veritas::registry::engine& registry_engine_;
};

}  // namespace veritas::registry
