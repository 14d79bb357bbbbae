#include <rxseal/blake3/hash.hpp>
#include <rxseal/crypto/signing_key.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace rxseal::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_private_key(const rxseal::schema::hash32_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   seed.data(), seed.size()),
                      EVP_PKEY_free};
}

}  // namespace

signing_key::signing_key(const rxseal::schema::hash32_t& seed,
                         const rxseal::schema::ed25519_public_key_t& public_key)
    : seed_{seed}, public_key_{public_key} {}

std::optional<signing_key> signing_key::from_seed(
    const rxseal::schema::hash32_t& seed) {
  auto pkey = make_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto public_key = rxseal::schema::ed25519_public_key_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &length) !=
          1 ||
      length != public_key.size()) {
    return std::nullopt;
  }
  return signing_key{seed, public_key};
}

std::optional<signing_key> signing_key::generate() {
  auto seed = rxseal::schema::hash32_t{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    return std::nullopt;
  }
  return from_seed(seed);
}

std::optional<rxseal::schema::ed25519_signature_t> signing_key::sign(
    const rxseal::schema::bytes_view_t& message) const {
  auto pkey = make_private_key(seed_);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = rxseal::schema::ed25519_signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

rxseal::schema::account_id_t make_account_id(
    const rxseal::schema::ed25519_public_key_t& public_key) {
  return rxseal::blake3::hash(
      rxseal::schema::bytes_view_t{public_key.data(), public_key.size()});
}

}  // namespace rxseal::crypto
