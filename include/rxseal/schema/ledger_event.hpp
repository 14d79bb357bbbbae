#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: ledger event.
// Prescription workflow: typed emission with indexed key/value attributes,
// returned in receipts and persisted in the ledger event log.
namespace rxseal::schema {

template <uint16_t Version>
struct ledger_event_attribute;

template <>
struct ledger_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using ledger_event_attribute_t = ledger_event_attribute<1>;

template <uint16_t Version>
struct ledger_event;

template <>
struct ledger_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<ledger_event_attribute_t> attributes;
};

using ledger_event_t = ledger_event<1>;

}  // namespace rxseal::schema
