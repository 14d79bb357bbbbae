#pragma once

#include <rxseal/crypto/signing_key.hpp>
#include <rxseal/schema/ledger_call.hpp>
#include <rxseal/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace rxseal::ledger {

/// Bytes covered by a call signature: SCALE(version, nonce, signer, payload).
rxseal::schema::bytes_t signing_bytes(
    const rxseal::schema::ledger_call_t& call);

/// Build and sign a call for `key`. Returns std::nullopt when signing fails.
std::optional<rxseal::schema::ledger_call_t> make_signed_call(
    const rxseal::crypto::signing_key& key,
    uint64_t nonce,
    rxseal::schema::ledger_payload_t payload);

}  // namespace rxseal::ledger
