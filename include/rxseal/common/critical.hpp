#pragma once

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

namespace rxseal::common {

/// Log, flush every sink and stop the process. Reserved for broken
/// invariants and stores that can no longer be read or written.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(fmt::format_string<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Arg>(arg),
                                        std::forward<Args>(args)...)});
}

}  // namespace rxseal::common
