#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace paylog::common {

/// Log and terminate. Reserved for failures the process cannot continue
/// past, such as the crypto library refusing to allocate a digest context.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace paylog::common
