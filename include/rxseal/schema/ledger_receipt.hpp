#pragma once

#include <rxseal/schema/ledger_event.hpp>
#include <rxseal/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: ledger receipt.
// Prescription workflow: outcome of one submitted call. Events may be present
// on a non-zero code when the ledger committed a state change while refusing
// the requested operation (a dispense attempt past expiry).
namespace rxseal::schema {

template <uint16_t Version>
struct ledger_receipt;

template <>
struct ledger_receipt<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  uint64_t height{};
  hash32_t call_hash{};
  std::vector<ledger_event_t> events;
};

using ledger_receipt_t = ledger_receipt<1>;

}  // namespace rxseal::schema
