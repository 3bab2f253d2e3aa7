#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace equimint::common {

/// Log `message` and terminate. Reserved for storage and decoding faults the
/// ledgers cannot continue past.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("fatal: {}", message);
  spdlog::default_logger()->flush();
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view detail) {
  spdlog::critical("fatal: {} ({})", message, detail);
  spdlog::default_logger()->flush();
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace equimint::common
