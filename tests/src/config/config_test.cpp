#include <gtest/gtest.h>
#include <veritas/config/config.hpp>
#include <veritas/registry/transaction_signing.hpp>
#include <veritas/testing/common.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

bool parse_node(const std::vector<const char*>& args,
                veritas::config::node_config& config,
                std::string& error) {
  auto description = veritas::config::make_options(config);
  auto positional = po::positional_options_description{};
  auto vm = po::variables_map{};
  return veritas::config::parse(static_cast<int>(args.size()), args.data(),
                                description, positional, vm, error);
}

}  // namespace

TEST(config, node_defaults_apply_without_arguments) {
  auto config = veritas::config::node_config{};
  auto error = std::string{};
  ASSERT_TRUE(parse_node({"veritas_node"}, config, error)) << error;
  EXPECT_EQ(config.listen_address, "0.0.0.0:50051");
  EXPECT_EQ(config.gas_price, 1u);
  EXPECT_EQ(config.block_interval_ms, 1'000u);
}

TEST(config, command_line_overrides_config_file) {
  auto path = veritas::testing::temporary_path{"veritas_config_file"};
  std::filesystem::create_directories(path.path());
  auto file = path.path() + "/node.ini";
  {
    auto out = std::ofstream{file};
    out << "chain-name = file-chain\n"
        << "gas-price = 7\n"
        << "owner-balance = 123\n";
  }

  auto config = veritas::config::node_config{};
  auto error = std::string{};
  ASSERT_TRUE(parse_node({"veritas_node", "--config", file.c_str(),
                          "--gas-price", "3"},
                         config, error))
      << error;
  EXPECT_EQ(config.chain_name, "file-chain");
  EXPECT_EQ(config.gas_price, 3u);
  EXPECT_EQ(config.owner_balance, 123u);
}

TEST(config, accepts_mutable_argv_from_main) {
  char program[] = "veritas_node";
  char flag[] = "--chain-name";
  char value[] = "argv-chain";
  char* argv[] = {program, flag, value};

  auto config = veritas::config::node_config{};
  auto description = veritas::config::make_options(config);
  auto positional = po::positional_options_description{};
  auto vm = po::variables_map{};
  auto error = std::string{};
  ASSERT_TRUE(veritas::config::parse(3, argv, description, positional, vm,
                                     error))
      << error;
  EXPECT_EQ(config.chain_name, "argv-chain");
}

TEST(config, unknown_option_is_an_error) {
  auto config = veritas::config::node_config{};
  auto error = std::string{};
  EXPECT_FALSE(parse_node({"veritas_node", "--no-such-option"}, config, error));
  EXPECT_FALSE(error.empty());
}

TEST(config, zero_block_interval_is_rejected) {
  auto config = veritas::config::node_config{};
  auto error = std::string{};
  EXPECT_FALSE(parse_node({"veritas_node", "--block-interval-ms", "0"}, config,
                          error));
  EXPECT_NE(error.find("block-interval-ms"), std::string::npos);

  EXPECT_TRUE(parse_node({"veritas_node", "--block-interval-ms", "5"}, config,
                         error))
      << error;
  EXPECT_EQ(config.block_interval_ms, 5u);
}

TEST(config, missing_config_file_is_an_error) {
  auto config = veritas::config::node_config{};
  auto error = std::string{};
  EXPECT_FALSE(parse_node({"veritas_node", "--config", "/nonexistent/x.ini"},
                          config, error));
  EXPECT_NE(error.find("cannot open"), std::string::npos);
}

TEST(config, make_genesis_requires_owner_key) {
  auto config = veritas::config::node_config{};
  auto error = std::string{};
  EXPECT_FALSE(veritas::config::make_genesis(config, error).has_value());
  EXPECT_FALSE(error.empty());

  auto owner = veritas::testing::make_signing_key(1);
  config.owner_public_key = veritas::schema::to_hex(owner.public_key());
  config.chain_name = "unit";
  auto genesis = veritas::config::make_genesis(config, error);
  ASSERT_TRUE(genesis.has_value()) << error;
  EXPECT_EQ(genesis->owner, owner.public_key());
  EXPECT_EQ(genesis->chain_id, veritas::registry::make_chain_id("unit"));
}

TEST(config, service_key_loads_from_hex_or_file) {
  auto key = veritas::testing::make_signing_key(3);
  auto hex = veritas::schema::to_hex(key.seed());

  auto config = veritas::config::client_config{};
  auto error = std::string{};
  EXPECT_FALSE(veritas::config::load_signing_key(config, error).has_value());

  config.service_key = hex;
  auto from_hex = veritas::config::load_signing_key(config, error);
  ASSERT_TRUE(from_hex.has_value()) << error;
  EXPECT_EQ(from_hex->public_key(), key.public_key());

  auto path = veritas::testing::temporary_path{"veritas_config_key"};
  std::filesystem::create_directories(path.path());
  config.service_key.clear();
  config.service_key_file = path.path() + "/service.key";
  {
    auto out = std::ofstream{config.service_key_file};
    out << hex << "\r\n";
  }
  auto from_file = veritas::config::load_signing_key(config, error);
  ASSERT_TRUE(from_file.has_value()) << error;
  EXPECT_EQ(from_file->public_key(), key.public_key());
}

TEST(config, trusted_key_defaults_to_service_key) {
  auto key = veritas::testing::make_signing_key(3);
  auto config = veritas::config::client_config{};
  auto error = std::string{};
  EXPECT_EQ(veritas::config::trusted_public_key(config, key, error),
            key.public_key());

  config.trusted_public_key = "zz";
  EXPECT_FALSE(
      veritas::config::trusted_public_key(config, key, error).has_value());
}

TEST(config, client_timeouts_feed_grpc_options) {
  auto config = veritas::config::client_config{};
  config.rpc_timeout_ms = 250;
  config.max_nonce_retries = 9;
  auto options = veritas::config::make_grpc_client_options(config);
  EXPECT_EQ(options.rpc_timeout, std::chrono::milliseconds{250});
  EXPECT_EQ(options.confirmation_timeout, std::chrono::milliseconds{120'000});
  EXPECT_EQ(options.max_nonce_retries, 9u);
}
