#include <rxseal/schema/encoding/scale/security_event_record.hpp>

namespace rxseal::schema {

void encode(const security_event_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.type, encoder);
  encode(o.severity, encoder);
  encode(o.code, encoder);
  encode(o.short_code, encoder);
  encode(o.message, encoder);
  encode(o.context, encoder);
  encode(o.recorded_at, encoder);
}

void decode(security_event_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.type, decoder);
  decode(o.severity, decoder);
  decode(o.code, decoder);
  decode(o.short_code, decoder);
  decode(o.message, decoder);
  decode(o.context, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace rxseal::schema
