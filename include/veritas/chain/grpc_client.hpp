#pragma once

#include <grpcpp/grpcpp.h>
#include <veritas/chain/client.hpp>
#include <veritas/crypto/signing_key.hpp>
#include <veritas/registry/v1/registry.grpc.pb.h>
#include <veritas/schema/encoding/scale/encoder.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace veritas::chain {

struct grpc_client_options final {
  std::chrono::milliseconds rpc_timeout{5'000};
  std::chrono::milliseconds confirmation_timeout{120'000};
  std::chrono::milliseconds receipt_poll_interval{500};
  uint32_t max_nonce_retries{3};
};

/// `client` backed by the registry node's gRPC service.
///
/// Chain id and the starting nonce are fetched from the node on first use.
/// Nonces are handed out from an atomic cursor so concurrent registrations
/// get distinct nonces; any rejection or transport failure resynchronizes
/// the cursor from the node's pending nonce.
class grpc_client final : public client {
 public:
  grpc_client(std::shared_ptr<grpc::ChannelInterface> channel,
              veritas::crypto::signing_key key,
              grpc_client_options options = {});

  register_result register_fingerprint(
      const veritas::schema::fingerprint_t& fingerprint) override;

  verify_result verify(
      const veritas::schema::fingerprint_t& fingerprint) override;

 private:
  struct submission final {
    std::optional<veritas::schema::transaction_id_t> transaction_id;
    std::optional<uint32_t> code;
    std::optional<veritas::schema::chain_error_code> error;
    std::string message;
  };

  std::optional<veritas::schema::chain_error_code> synchronize(
      std::string& message);
  submission submit(const veritas::schema::fingerprint_t& fingerprint);
  register_result wait_for_receipt(
      const veritas::schema::transaction_id_t& transaction_id);
  void set_deadline(grpc::ClientContext& context) const;

  std::unique_ptr<veritas::registry::v1::Registry::Stub> stub_;
  veritas::crypto::signing_key key_;
  grpc_client_options options_;
  veritas::scale_encoder_t encoder_;
  std::mutex sync_mutex_;
  std::optional<veritas::schema::chain_id_t> chain_id_;
  std::atomic<bool> nonce_synced_{false};
  std::atomic<uint64_t> next_nonce_{};
};

}  // namespace veritas::chain
