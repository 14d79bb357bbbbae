#pragma once

#include <rxseal/schema/medicine_entry.hpp>
#include <rxseal/schema/offchain_status.hpp>
#include <rxseal/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: off-chain record.
// Prescription workflow: mutable metadata joined to the ledger record by
// short code. `hash_verified` is unset until a gate or reconciliation run has
// compared the commitments.
namespace rxseal::schema {

template <uint16_t Version>
struct offchain_record;

template <>
struct offchain_record<1> final {
  uint16_t version{1};
  std::string short_code;
  account_id_t doctor{};
  std::string patient_name;
  std::string patient_age;
  std::vector<medicine_entry_t> medicines;
  std::string notes;
  offchain_status_t status{offchain_status_t::active};
  uint32_t usage_count{};
  uint32_t max_usage{};
  timestamp_seconds_t expiry_date{};
  timestamp_seconds_t issued_at{};
  std::optional<timestamp_seconds_t> dispensed_at;
  bool ledger_synced{};
  std::optional<bool> hash_verified;
};

using offchain_record_t = offchain_record<1>;

}  // namespace rxseal::schema
