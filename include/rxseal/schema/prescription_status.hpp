#pragma once

#include <rxseal/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: prescription status.
// Prescription workflow: ledger lifecycle of a prescription. CREATED is the
// default value of an unknown record; USED and EXPIRED are terminal.
namespace rxseal::schema {

enum class prescription_status_t : uint8_t {
  created = 0,
  active = 1,
  used = 2,
  expired = 3
};

inline constexpr auto kPrescriptionStatusMappings = std::array{
    std::pair<std::string_view, prescription_status_t>{
        "CREATED", prescription_status_t::created},
    std::pair<std::string_view, prescription_status_t>{
        "ACTIVE", prescription_status_t::active},
    std::pair<std::string_view, prescription_status_t>{
        "USED", prescription_status_t::used},
    std::pair<std::string_view, prescription_status_t>{
        "EXPIRED", prescription_status_t::expired},
};

template <>
inline std::optional<prescription_status_t> try_from_string<
    prescription_status_t>(const std::string_view value) {
  return from_string(value, kPrescriptionStatusMappings);
}

inline constexpr std::string_view to_string(const prescription_status_t value) {
  return to_string_or(value, kPrescriptionStatusMappings, "UNKNOWN");
}

inline constexpr bool is_terminal(const prescription_status_t value) {
  return value == prescription_status_t::used ||
         value == prescription_status_t::expired;
}

}  // namespace rxseal::schema
