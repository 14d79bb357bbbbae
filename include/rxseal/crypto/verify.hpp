#pragma once

#include <rxseal/schema/primitives.hpp>

namespace rxseal::crypto {

/// True when the linked OpenSSL provides ed25519.
bool available();

bool verify_signature(const rxseal::schema::bytes_view_t& message,
                      const rxseal::schema::ed25519_public_key_t& signer,
                      const rxseal::schema::ed25519_signature_t& signature);

}  // namespace rxseal::crypto
