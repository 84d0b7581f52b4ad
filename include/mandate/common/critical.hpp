#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace mandate::common {

/// Log and terminate. Used where registry state can no longer be trusted:
/// backend I/O failures, undecodable persisted bytes, unusable CLI input.
[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view detail = {}) {
  if (detail.empty()) {
    spdlog::critical("{}", message);
  } else {
    spdlog::critical("{}: {}", message, detail);
  }
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace mandate::common
