#pragma once

#include <rxseal/schema/primitives.hpp>
#include <rxseal/schema/security_event_severity.hpp>
#include <rxseal/schema/security_event_type.hpp>
#include <string>
#include <utility>
#include <vector>

namespace rxseal::schema {

template <uint16_t Version>
struct security_event_record;

template <>
struct security_event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  security_event_type_t type{};
  security_event_severity_t severity{};
  std::string code;
  std::string short_code;
  std::string message;
  std::vector<std::pair<std::string, std::string>> context;
  timestamp_seconds_t recorded_at{};
};

using security_event_record_t = security_event_record<1>;

}  // namespace rxseal::schema
