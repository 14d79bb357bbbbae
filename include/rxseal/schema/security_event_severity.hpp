#pragma once

#include <rxseal/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: security event severity.
// Prescription workflow: an unreachable ledger is an error; a broken
// commitment is critical.
namespace rxseal::schema {

enum class security_event_severity_t : uint8_t {
  info = 0,
  warning = 1,
  error = 2,
  critical = 3,
};

inline constexpr auto kSecurityEventSeverityMappings = std::array{
    std::pair<std::string_view, security_event_severity_t>{
        "info", security_event_severity_t::info},
    std::pair<std::string_view, security_event_severity_t>{
        "warning", security_event_severity_t::warning},
    std::pair<std::string_view, security_event_severity_t>{
        "error", security_event_severity_t::error},
    std::pair<std::string_view, security_event_severity_t>{
        "critical", security_event_severity_t::critical},
};

inline constexpr std::string_view to_string(
    const security_event_severity_t value) {
  return to_string_or(value, kSecurityEventSeverityMappings, "unknown");
}

}  // namespace rxseal::schema
