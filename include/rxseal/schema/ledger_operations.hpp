#pragma once

#include <rxseal/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: ledger operations.
// Prescription workflow: payloads accepted by the ledger, one per role-gated
// entry point.
namespace rxseal::schema {

template <uint16_t Version>
struct register_doctor;

template <>
struct register_doctor<1> final {
  uint16_t version{1};
  account_id_t account{};
};

using register_doctor_t = register_doctor<1>;

template <uint16_t Version>
struct register_pharmacy;

template <>
struct register_pharmacy<1> final {
  uint16_t version{1};
  account_id_t account{};
};

using register_pharmacy_t = register_pharmacy<1>;

template <uint16_t Version>
struct issue_prescription;

template <>
struct issue_prescription<1> final {
  uint16_t version{1};
  prescription_id_t id{};
  hash32_t patient_hash{};
  hash32_t medication_hash{};
  uint64_t quantity{};
  timestamp_seconds_t expiry_date{};
  uint32_t max_usage{};
};

using issue_prescription_t = issue_prescription<1>;

template <uint16_t Version>
struct dispense_prescription;

template <>
struct dispense_prescription<1> final {
  uint16_t version{1};
  prescription_id_t id{};
};

using dispense_prescription_t = dispense_prescription<1>;

template <uint16_t Version>
struct set_patient_commitment;

template <>
struct set_patient_commitment<1> final {
  uint16_t version{1};
  prescription_id_t id{};
  hash32_t commitment{};
};

using set_patient_commitment_t = set_patient_commitment<1>;

using ledger_payload_t = std::variant<register_doctor_t,
                                      register_pharmacy_t,
                                      issue_prescription_t,
                                      dispense_prescription_t,
                                      set_patient_commitment_t>;

}  // namespace rxseal::schema
