#pragma once

#include <rxseal/schema/ledger_operations.hpp>
#include <rxseal/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger call.
// Prescription workflow: signed envelope submitted to the ledger. The caller's
// account is the BLAKE3 digest of `signer`.
namespace rxseal::schema {

template <uint16_t Version>
struct ledger_call;

template <>
struct ledger_call<1> final {
  uint16_t version{1};
  uint64_t nonce{};
  ed25519_public_key_t signer{};
  ledger_payload_t payload;
  ed25519_signature_t signature{};
};

using ledger_call_t = ledger_call<1>;

}  // namespace rxseal::schema
