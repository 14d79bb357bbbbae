#pragma once

#include <rxseal/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: off-chain status.
// Prescription workflow: display-side lifecycle kept next to the record
// metadata. Moves are restricted by is_valid_transition.
namespace rxseal::schema {

enum class offchain_status_t : uint8_t {
  active = 0,
  pending_dispense = 1,
  dispensed = 2,
  used = 3,
  expired = 4
};

inline constexpr auto kOffchainStatusMappings = std::array{
    std::pair<std::string_view, offchain_status_t>{"ACTIVE",
                                                   offchain_status_t::active},
    std::pair<std::string_view, offchain_status_t>{
        "PENDING_DISPENSE", offchain_status_t::pending_dispense},
    std::pair<std::string_view, offchain_status_t>{
        "DISPENSED", offchain_status_t::dispensed},
    std::pair<std::string_view, offchain_status_t>{"USED",
                                                   offchain_status_t::used},
    std::pair<std::string_view, offchain_status_t>{"EXPIRED",
                                                   offchain_status_t::expired},
};

template <>
inline std::optional<offchain_status_t> try_from_string<offchain_status_t>(
    const std::string_view value) {
  return from_string(value, kOffchainStatusMappings);
}

inline constexpr std::string_view to_string(const offchain_status_t value) {
  return to_string_or(value, kOffchainStatusMappings, "UNKNOWN");
}

inline constexpr bool is_valid_transition(const offchain_status_t from,
                                          const offchain_status_t to) {
  using enum offchain_status_t;
  switch (from) {
    case active:
      return to == pending_dispense || to == expired;
    case pending_dispense:
      return to == dispensed || to == used || to == active;
    case dispensed:
      return to == pending_dispense || to == active || to == expired;
    case used:
    case expired:
    default:
      return false;
  }
}

}  // namespace rxseal::schema
