#include <rxseal/schema/encoding/scale/ledger_receipt.hpp>
#include <rxseal/schema/encoding/scale/ledger_event.hpp>

namespace rxseal::schema {

void encode(const ledger_receipt<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.code, encoder);
  encode(o.log, encoder);
  encode(o.info, encoder);
  encode(o.codespace, encoder);
  encode(o.height, encoder);
  encode(o.call_hash, encoder);
  encode(o.events, encoder);
}

void decode(ledger_receipt<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.code, decoder);
  decode(o.log, decoder);
  decode(o.info, decoder);
  decode(o.codespace, decoder);
  decode(o.height, decoder);
  decode(o.call_hash, decoder);
  decode(o.events, decoder);
}

}  // namespace rxseal::schema
