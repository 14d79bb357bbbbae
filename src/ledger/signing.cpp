#include <rxseal/ledger/signing.hpp>
#include <rxseal/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace rxseal::ledger {

rxseal::schema::bytes_t signing_bytes(
    const rxseal::schema::ledger_call_t& call) {
  auto encoder = rxseal::schema::encoding::scale_encoder_t{};
  return encoder.encode(
      std::tuple{call.version, call.nonce, call.signer, call.payload});
}

std::optional<rxseal::schema::ledger_call_t> make_signed_call(
    const rxseal::crypto::signing_key& key,
    const uint64_t nonce,
    rxseal::schema::ledger_payload_t payload) {
  auto call = rxseal::schema::ledger_call_t{.nonce = nonce,
                                            .signer = key.public_key(),
                                            .payload = std::move(payload)};
  auto message = signing_bytes(call);
  auto signature = key.sign(rxseal::schema::bytes_view_t{message});
  if (!signature) {
    return std::nullopt;
  }
  call.signature = *signature;
  return call;
}

}  // namespace rxseal::ledger
