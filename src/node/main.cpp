#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <veritas/config/config.hpp>
#include <veritas/crypto/verify.hpp>
#include <veritas/registry/block_producer.hpp>
#include <veritas/registry/engine.hpp>
#include <veritas/registry/server.hpp>
#include <veritas/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto config = veritas::config::node_config{};
  auto description = veritas::config::make_options(config);
  auto vm = boost::program_options::variables_map{};
  auto error = std::string{};
  auto positional = boost::program_options::positional_options_description{};
  if (!veritas::config::parse(argc, argv, description, positional, vm,
                              error)) {
    std::cerr << error << std::endl << description << std::endl;
    return 1;
  }
  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "veritas", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(config.log_level));

  if (!veritas::crypto::available()) {
    spdlog::critical("OpenSSL does not provide Ed25519");
    spdlog::shutdown();
    return 1;
  }

  auto genesis = veritas::config::make_genesis(config, error);
  if (!genesis) {
    spdlog::critical("Invalid genesis configuration: {}", error);
    spdlog::shutdown();
    return 1;
  }

  auto encoder = veritas::scale_encoder_t{};
  auto storage = veritas::storage::make_storage<
      veritas::storage::rocksdb_storage_tag>(config.db_path);
  auto engine = veritas::registry::engine{
      encoder, storage, genesis.value(),
      static_cast<std::size_t>(config.max_pending_transactions)};
  auto producer = veritas::registry::block_producer{
      engine, std::chrono::milliseconds{config.block_interval_ms}};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = veritas::registry::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(config.listen_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to listen on {}", config.listen_address);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("Registry gRPC service listening on {}", config.listen_address);

  producer.start();

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  producer.stop();
  // Flush whatever was admitted before shutdown.
  engine.produce_block();
  spdlog::shutdown();
  return 0;
}
