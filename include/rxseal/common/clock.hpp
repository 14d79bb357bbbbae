#pragma once

#include <rxseal/schema/primitives.hpp>

#include <functional>
#include <string>

namespace rxseal::common {

/// Source of the current time in unix seconds.
using unix_clock_t = std::function<rxseal::schema::timestamp_seconds_t()>;

/// Wall clock backed by std::chrono::system_clock.
unix_clock_t system_unix_clock();

/// Format unix seconds as `YYYY-MM-DDTHH:MM:SS.000Z`.
std::string to_iso8601(rxseal::schema::timestamp_seconds_t seconds);

}  // namespace rxseal::common
