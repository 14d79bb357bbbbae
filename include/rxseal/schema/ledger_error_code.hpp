#pragma once

#include <cstdint>

// Schema type: ledger error code.
// Prescription workflow: receipt codes returned by the ledger; zero is
// success.
namespace rxseal::schema {

enum class ledger_error_code : uint32_t {
  invalid_call = 1,
  unsupported_call_version = 2,
  invalid_signature = 3,
  invalid_nonce = 4,
  not_owner = 10,
  not_doctor = 11,
  not_pharmacy = 12,
  not_issuer = 13,
  invalid_prescription_id = 20,
  prescription_exists = 21,
  invalid_usage_limit = 22,
  invalid_expiry = 23,
  empty_commitment = 24,
  commitment_already_set = 25,
  prescription_not_active = 30,
  prescription_expired = 31,
  transport_failure = 100,
};

}  // namespace rxseal::schema
