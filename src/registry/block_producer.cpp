#include <spdlog/spdlog.h>
#include <veritas/registry/block_producer.hpp>

namespace veritas::registry {

block_producer::block_producer(veritas::registry::engine& engine,
                               std::chrono::milliseconds interval)
    : engine_{engine}, interval_{interval} {}

block_producer::~block_producer() {
  stop();
}

void block_producer::start() {
  auto lock = std::scoped_lock{mutex_};
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_ = std::thread{[this] { run(); }};
  spdlog::info("Block producer started ({} ms interval)", interval_.count());
}

void block_producer::stop() {
  {
    auto lock = std::scoped_lock{mutex_};
    if (!thread_.joinable()) {
      return;
    }
    stopping_ = true;
  }
  wakeup_.notify_all();
  thread_.join();
  spdlog::info("Block producer stopped");
}

void block_producer::run() {
  auto lock = std::unique_lock{mutex_};
  while (!stopping_) {
    wakeup_.wait_for(lock, interval_, [this] { return stopping_; });
    if (stopping_) {
      break;
    }
    lock.unlock();
    if (auto block = engine_.produce_block()) {
      spdlog::debug("Block {} state root {}", block->height,
                    veritas::schema::to_hex(block->state_root));
    }
    lock.lock();
  }
}

}  // namespace veritas::registry
