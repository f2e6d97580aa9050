#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace notary::common {

/// Log, flush and terminate. Used for faults the registry cannot recover
/// from (storage corruption, impossible encodings).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace notary::common
