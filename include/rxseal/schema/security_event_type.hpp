#pragma once

#include <rxseal/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: security event type.
// Prescription workflow: classifies audit events raised around validation
// and ledger mutation.
namespace rxseal::schema {

enum class security_event_type_t : uint16_t {
  validation_rejected = 1,
  hash_mismatch = 2,
  ledger_unreachable = 3,
  ledger_refused = 4,
  snapshot_malformed = 5,
  reconciliation_mismatch = 6,
};

inline constexpr auto kSecurityEventTypeMappings = std::array{
    std::pair<std::string_view, security_event_type_t>{
        "validation_rejected", security_event_type_t::validation_rejected},
    std::pair<std::string_view, security_event_type_t>{
        "hash_mismatch", security_event_type_t::hash_mismatch},
    std::pair<std::string_view, security_event_type_t>{
        "ledger_unreachable", security_event_type_t::ledger_unreachable},
    std::pair<std::string_view, security_event_type_t>{
        "ledger_refused", security_event_type_t::ledger_refused},
    std::pair<std::string_view, security_event_type_t>{
        "snapshot_malformed", security_event_type_t::snapshot_malformed},
    std::pair<std::string_view, security_event_type_t>{
        "reconciliation_mismatch",
        security_event_type_t::reconciliation_mismatch},
};

inline constexpr std::string_view to_string(const security_event_type_t value) {
  return to_string_or(value, kSecurityEventTypeMappings, "unknown");
}

}  // namespace rxseal::schema
