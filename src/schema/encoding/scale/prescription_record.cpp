#include <rxseal/schema/encoding/scale/prescription_record.hpp>

namespace rxseal::schema {

void encode(const prescription_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.issuer, encoder);
  encode(o.status, encoder);
  encode(o.usage_count, encoder);
  encode(o.max_usage, encoder);
  encode(o.quantity, encoder);
  encode(o.expiry_date, encoder);
  encode(o.issued_at, encoder);
  encode(o.patient_hash, encoder);
  encode(o.medication_hash, encoder);
  encode(o.patient_commitment, encoder);
}

void decode(prescription_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.issuer, decoder);
  decode(o.status, decoder);
  decode(o.usage_count, decoder);
  decode(o.max_usage, decoder);
  decode(o.quantity, decoder);
  decode(o.expiry_date, decoder);
  decode(o.issued_at, decoder);
  decode(o.patient_hash, decoder);
  decode(o.medication_hash, decoder);
  decode(o.patient_commitment, decoder);
}

}  // namespace rxseal::schema
