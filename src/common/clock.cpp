#include <rxseal/common/clock.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <ctime>

namespace rxseal::common {

unix_clock_t system_unix_clock() {
  return [] {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<rxseal::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now).count());
  };
}

std::string to_iso8601(const rxseal::schema::timestamp_seconds_t seconds) {
  auto time = static_cast<std::time_t>(seconds);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.000Z", fmt::gmtime(time));
}

}  // namespace rxseal::common
