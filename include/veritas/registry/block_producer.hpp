#pragma once

#include <veritas/registry/engine.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace veritas::registry {

/// Background thread that calls `engine::produce_block` every interval.
/// Empty intervals produce no block.
class block_producer final {
 public:
  block_producer(veritas::registry::engine& engine,
                 std::chrono::milliseconds interval);
  ~block_producer();

  block_producer(const block_producer&) = delete;
  block_producer& operator=(const block_producer&) = delete;

  void start();
  void stop();

 private:
  void run();

  veritas::registry::engine& engine_;
  std::chrono::milliseconds interval_;
  std::mutex mutex_;
  std::condition_variable wakeup_;
  bool stopping_{false};
  std::thread thread_;
};

}  // namespace veritas::registry
