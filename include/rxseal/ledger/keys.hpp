#pragma once

#include <rxseal/schema/primitives.hpp>
#include <rxseal/schema/role_id.hpp>

#include <cstdint>
#include <string_view>

// Storage layout of the ledger. Fixed keys live under RX|SYS, per-entity state
// under RX|STATE and the event log under RX|EVENT, ordered by big-endian id.
namespace rxseal::ledger::keys {

inline constexpr auto kOwnerKey = std::string_view{"RX|SYS|OWNER"};
inline constexpr auto kHeightKey = std::string_view{"RX|SYS|HEIGHT"};
inline constexpr auto kEventSequenceKey =
    std::string_view{"RX|SYS|EVENT_SEQUENCE"};
inline constexpr auto kPrescriptionPrefix =
    std::string_view{"RX|STATE|PRESCRIPTION|"};
inline constexpr auto kRolePrefix = std::string_view{"RX|STATE|ROLE|"};
inline constexpr auto kNoncePrefix = std::string_view{"RX|STATE|NONCE|"};
inline constexpr auto kEventPrefix = std::string_view{"RX|EVENT|"};

rxseal::schema::bytes_t make_key(std::string_view fixed_key);
rxseal::schema::bytes_t make_prescription_key(
    const rxseal::schema::prescription_id_t& id);
rxseal::schema::bytes_t make_role_key(rxseal::schema::role_id_t role,
                                      const rxseal::schema::account_id_t& account);
rxseal::schema::bytes_t make_nonce_key(
    const rxseal::schema::account_id_t& account);
rxseal::schema::bytes_t make_event_key(uint64_t event_id);

}  // namespace rxseal::ledger::keys
