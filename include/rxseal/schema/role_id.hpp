#pragma once

#include <rxseal/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Prescription workflow: ledger roles. The owner grants doctor and pharmacy
// membership; doctors issue and pharmacies dispense.
namespace rxseal::schema {

enum class role_id_t : uint8_t { owner = 0, doctor = 1, pharmacy = 2 };

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"owner", role_id_t::owner},
    std::pair<std::string_view, role_id_t>{"doctor", role_id_t::doctor},
    std::pair<std::string_view, role_id_t>{"pharmacy", role_id_t::pharmacy},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string_or(value, kRoleIdMappings, "unknown");
}

}  // namespace rxseal::schema
