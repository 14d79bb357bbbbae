#include <rxseal/schema/encoding/scale/ledger_call.hpp>
#include <rxseal/schema/encoding/scale/ledger_operations.hpp>

namespace rxseal::schema {

void encode(const ledger_call<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(ledger_call<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace rxseal::schema
