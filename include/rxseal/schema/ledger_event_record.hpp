#pragma once

#include <rxseal/schema/ledger_event.hpp>
#include <rxseal/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger event record.
// Prescription workflow: persisted event log entry, addressed by a dense
// sequence number starting at 1.
namespace rxseal::schema {

template <uint16_t Version>
struct ledger_event_record;

template <>
struct ledger_event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  timestamp_seconds_t recorded_at{};
  ledger_event_t event;
};

using ledger_event_record_t = ledger_event_record<1>;

}  // namespace rxseal::schema
