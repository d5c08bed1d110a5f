#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sentinel::common {

/// Log an unrecoverable fault and terminate the node.
///
/// Reserved for storage and codec faults on trusted data; transaction level
/// failures are reported through result codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace sentinel::common
