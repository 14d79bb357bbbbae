#pragma once

#include <rxseal/schema/prescription_status.hpp>
#include <rxseal/schema/primitives.hpp>
#include <cstdint>

// Schema type: prescription record.
// Prescription workflow: authoritative ledger state for one prescription. An
// unknown id reads back as a zero record whose id is the zero hash.
namespace rxseal::schema {

template <uint16_t Version>
struct prescription_record;

template <>
struct prescription_record<1> final {
  uint16_t version{1};
  prescription_id_t id{};
  account_id_t issuer{};
  prescription_status_t status{prescription_status_t::created};
  uint32_t usage_count{};
  uint32_t max_usage{};
  uint64_t quantity{};
  timestamp_seconds_t expiry_date{};
  timestamp_seconds_t issued_at{};
  hash32_t patient_hash{};
  hash32_t medication_hash{};
  hash32_t patient_commitment{};
};

using prescription_record_t = prescription_record<1>;

inline bool exists(const prescription_record_t& record) {
  return !is_zero_hash(record.id);
}

/// Status as a reader must see it at `now`: an ACTIVE record whose expiry has
/// passed reads as EXPIRED even before the ledger commits the transition.
inline prescription_status_t effective_status(
    const prescription_record_t& record,
    const timestamp_seconds_t now) {
  if (record.status == prescription_status_t::active &&
      record.expiry_date <= now) {
    return prescription_status_t::expired;
  }
  return record.status;
}

}  // namespace rxseal::schema
