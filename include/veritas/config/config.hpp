#pragma once

#include <boost/program_options.hpp>
#include <veritas/chain/grpc_client.hpp>
#include <veritas/crypto/signing_key.hpp>
#include <veritas/schema/genesis.hpp>
#include <veritas/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace veritas::config {

/// Registry node settings, built once at startup.
struct node_config final {
  std::string listen_address{"0.0.0.0:50051"};
  std::string db_path{"veritas-registry-db"};
  std::string chain_name{"veritas-local"};
  std::string owner_public_key;
  veritas::schema::amount_t owner_balance{1'000'000'000'000};
  veritas::schema::amount_t gas_price{1};
  uint64_t block_interval_ms{1'000};
  uint64_t max_pending_transactions{10'000};
  std::string log_level{"info"};
  std::string log_file{"veritas-node.log"};
};

/// Issuance/verification settings, built once at startup.
struct client_config final {
  std::string registry_endpoint{"127.0.0.1:50051"};
  std::string service_key;
  std::string service_key_file;
  uint64_t rpc_timeout_ms{5'000};
  uint64_t confirmation_timeout_ms{120'000};
  uint64_t receipt_poll_interval_ms{500};
  uint32_t max_nonce_retries{3};
  std::string records_db_path{"veritas-records-db"};
  std::string trusted_public_key;
  std::string log_level{"warn"};
};

boost::program_options::options_description make_options(node_config& config);
boost::program_options::options_description make_options(
    client_config& config);

/// Parse the command line, then the INI file named by `--config` when
/// present. Command line values win over file values. Returns false (with
/// `error`) on unknown or malformed options.
bool parse(int argc,
           const char* const argv[],
           const boost::program_options::options_description& description,
           const boost::program_options::positional_options_description&
               positional,
           boost::program_options::variables_map& vm,
           std::string& error);

std::optional<veritas::schema::genesis_t> make_genesis(
    const node_config& config,
    std::string& error);

/// Service key from `service_key` (hex seed) or, when empty, from the
/// first line of `service_key_file`.
std::optional<veritas::crypto::signing_key> load_signing_key(
    const client_config& config,
    std::string& error);

/// `trusted_public_key` when configured, otherwise the service key's own.
std::optional<veritas::schema::public_key_t> trusted_public_key(
    const client_config& config,
    const veritas::crypto::signing_key& key,
    std::string& error);

veritas::chain::grpc_client_options make_grpc_client_options(
    const client_config& config);

}  // namespace veritas::config
