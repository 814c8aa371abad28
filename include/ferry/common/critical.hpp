#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ferry::common {

/// Logs a fatal condition, flushes every sink and takes the process down.
/// Reserved for broken local state (storage failures, corrupt records);
/// protocol rejections are reported through operation results instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace ferry::common
