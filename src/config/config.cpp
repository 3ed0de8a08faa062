#include <spdlog/spdlog.h>
#include <veritas/config/config.hpp>
#include <veritas/registry/transaction_signing.hpp>

#include <chrono>
#include <fstream>

namespace po = boost::program_options;

namespace veritas::config {

po::options_description make_options(node_config& config) {
  auto description = po::options_description{"veritas_node options"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI configuration file")(
      "listen,l",
      po::value<std::string>(&config.listen_address)
          ->default_value(config.listen_address),
      "IP:Port for the registry gRPC service")(
      "db-path",
      po::value<std::string>(&config.db_path)->default_value(config.db_path),
      "RocksDB directory for chain state")(
      "chain-name",
      po::value<std::string>(&config.chain_name)
          ->default_value(config.chain_name),
      "chain name; the chain id is its BLAKE3 hash")(
      "owner-public-key", po::value<std::string>(&config.owner_public_key),
      "registry owner Ed25519 public key (hex), used at genesis")(
      "owner-balance",
      po::value<veritas::schema::amount_t>(&config.owner_balance)
          ->default_value(config.owner_balance),
      "owner starting balance, used at genesis")(
      "gas-price",
      po::value<veritas::schema::amount_t>(&config.gas_price)
          ->default_value(config.gas_price),
      "price per gas unit, used at genesis")(
      "block-interval-ms",
      po::value<uint64_t>(&config.block_interval_ms)
          ->default_value(config.block_interval_ms)
          ->notifier([](const uint64_t value) {
            if (value == 0) {
              throw po::validation_error{
                  po::validation_error::invalid_option_value,
                  "block-interval-ms", "0"};
            }
          }),
      "block production interval")(
      "max-pending-transactions",
      po::value<uint64_t>(&config.max_pending_transactions)
          ->default_value(config.max_pending_transactions),
      "transaction queue capacity")(
      "log-level",
      po::value<std::string>(&config.log_level)
          ->default_value(config.log_level),
      "trace|debug|info|warn|error|critical|off")(
      "log-file",
      po::value<std::string>(&config.log_file)->default_value(config.log_file),
      "log file path");
  return description;
}

po::options_description make_options(client_config& config) {
  auto description = po::options_description{"veritas options"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI configuration file")(
      "registry,r",
      po::value<std::string>(&config.registry_endpoint)
          ->default_value(config.registry_endpoint),
      "registry node gRPC endpoint")(
      "service-key", po::value<std::string>(&config.service_key),
      "service Ed25519 private key seed (hex)")(
      "service-key-file", po::value<std::string>(&config.service_key_file),
      "file holding the service key seed (hex)")(
      "rpc-timeout-ms",
      po::value<uint64_t>(&config.rpc_timeout_ms)
          ->default_value(config.rpc_timeout_ms),
      "deadline for each registry call")(
      "confirmation-timeout-ms",
      po::value<uint64_t>(&config.confirmation_timeout_ms)
          ->default_value(config.confirmation_timeout_ms),
      "how long to wait for a registration to be confirmed")(
      "receipt-poll-interval-ms",
      po::value<uint64_t>(&config.receipt_poll_interval_ms)
          ->default_value(config.receipt_poll_interval_ms),
      "receipt polling interval")(
      "max-nonce-retries",
      po::value<uint32_t>(&config.max_nonce_retries)
          ->default_value(config.max_nonce_retries),
      "resubmissions after a nonce conflict")(
      "records-db-path",
      po::value<std::string>(&config.records_db_path)
          ->default_value(config.records_db_path),
      "RocksDB directory for certificate records")(
      "trusted-public-key", po::value<std::string>(&config.trusted_public_key),
      "public key records must be signed with (hex); defaults to the service "
      "key")("log-level",
             po::value<std::string>(&config.log_level)
                 ->default_value(config.log_level),
             "trace|debug|info|warn|error|critical|off");
  return description;
}

bool parse(int argc,
           const char* const argv[],
           const po::options_description& description,
           const po::positional_options_description& positional,
           po::variables_map& vm,
           std::string& error) {
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input.good()) {
        error = "cannot open config file '" + path + "'";
        return false;
      }
      po::store(po::parse_config_file(input, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    error = ex.what();
    return false;
  }
  return true;
}

std::optional<veritas::schema::genesis_t> make_genesis(
    const node_config& config,
    std::string& error) {
  auto owner = veritas::schema::try_make_public_key(config.owner_public_key);
  if (!owner) {
    error = "owner-public-key must be 32 bytes of hex";
    return std::nullopt;
  }
  if (config.chain_name.empty()) {
    error = "chain-name must not be empty";
    return std::nullopt;
  }
  auto genesis = veritas::schema::genesis_t{};
  genesis.chain_id = veritas::registry::make_chain_id(config.chain_name);
  genesis.owner = owner.value();
  genesis.owner_balance = config.owner_balance;
  genesis.gas_price = config.gas_price;
  return genesis;
}

std::optional<veritas::crypto::signing_key> load_signing_key(
    const client_config& config,
    std::string& error) {
  if (!config.service_key.empty()) {
    return veritas::crypto::signing_key::from_hex(config.service_key, error);
  }
  if (config.service_key_file.empty()) {
    error = "no service key configured (service-key or service-key-file)";
    return std::nullopt;
  }
  auto input = std::ifstream{config.service_key_file};
  auto line = std::string{};
  if (!input.good() || !std::getline(input, line)) {
    error = "cannot read service key file '" + config.service_key_file + "'";
    return std::nullopt;
  }
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
    line.pop_back();
  }
  return veritas::crypto::signing_key::from_hex(line, error);
}

std::optional<veritas::schema::public_key_t> trusted_public_key(
    const client_config& config,
    const veritas::crypto::signing_key& key,
    std::string& error) {
  if (config.trusted_public_key.empty()) {
    return key.public_key();
  }
  auto trusted =
      veritas::schema::try_make_public_key(config.trusted_public_key);
  if (!trusted) {
    error = "trusted-public-key must be 32 bytes of hex";
    return std::nullopt;
  }
  if (trusted.value() != key.public_key()) {
    spdlog::warn("Trusted public key differs from the service key");
  }
  return trusted;
}

veritas::chain::grpc_client_options make_grpc_client_options(
    const client_config& config) {
  auto options = veritas::chain::grpc_client_options{};
  options.rpc_timeout = std::chrono::milliseconds{config.rpc_timeout_ms};
  options.confirmation_timeout =
      std::chrono::milliseconds{config.confirmation_timeout_ms};
  options.receipt_poll_interval =
      std::chrono::milliseconds{config.receipt_poll_interval_ms};
  options.max_nonce_retries = config.max_nonce_retries;
  return options;
}

}  // namespace veritas::config
