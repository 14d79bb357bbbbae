#pragma once

#include <rxseal/schema/primitives.hpp>

#include <optional>

namespace rxseal::crypto {

/// ed25519 private key held as its 32 byte seed.
///
/// Derives the public key once at construction; signing goes through OpenSSL
/// EVP with a fresh key object per call.
class signing_key final {
 public:
  /// Returns std::nullopt when OpenSSL rejects the seed.
  static std::optional<signing_key> from_seed(
      const rxseal::schema::hash32_t& seed);

  /// Generate a key from OpenSSL's random source.
  static std::optional<signing_key> generate();

  const rxseal::schema::ed25519_public_key_t& public_key() const {
    return public_key_;
  }
  const rxseal::schema::hash32_t& seed() const { return seed_; }

  std::optional<rxseal::schema::ed25519_signature_t> sign(
      const rxseal::schema::bytes_view_t& message) const;

 private:
  signing_key(const rxseal::schema::hash32_t& seed,
              const rxseal::schema::ed25519_public_key_t& public_key);

  rxseal::schema::hash32_t seed_;
  rxseal::schema::ed25519_public_key_t public_key_;
};

/// Ledger account of a caller: BLAKE3 of the ed25519 public key.
rxseal::schema::account_id_t make_account_id(
    const rxseal::schema::ed25519_public_key_t& public_key);

}  // namespace rxseal::crypto
