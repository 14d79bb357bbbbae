#pragma once

#include <cstdint>
#include <string>

// Schema type: medicine entry.
// Prescription workflow: one medicine line as entered by the prescriber.
// `quantity` keeps the raw text; only the canonical snapshot coerces it.
// `instructions` never participates in the medication commitment.
namespace rxseal::schema {

template <uint16_t Version>
struct medicine_entry;

template <>
struct medicine_entry<1> final {
  uint16_t version{1};
  std::string name;
  std::string dosage;
  std::string quantity;
  std::string instructions;
};

using medicine_entry_t = medicine_entry<1>;

}  // namespace rxseal::schema
