#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace veritas::common {

/// Log, flush and terminate. Reserved for broken invariants (storage that
/// cannot be opened or read, corrupted persisted state), never for input or
/// chain errors.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view detail) {
  spdlog::critical("{}: {}", message, detail);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace veritas::common
