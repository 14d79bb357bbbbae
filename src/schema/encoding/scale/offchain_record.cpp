#include <rxseal/schema/encoding/scale/offchain_record.hpp>

namespace rxseal::schema {

void encode(const medicine_entry<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.dosage, encoder);
  encode(o.quantity, encoder);
  encode(o.instructions, encoder);
}

void decode(medicine_entry<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.dosage, decoder);
  decode(o.quantity, decoder);
  decode(o.instructions, decoder);
}

void encode(const offchain_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.short_code, encoder);
  encode(o.doctor, encoder);
  encode(o.patient_name, encoder);
  encode(o.patient_age, encoder);
  encode(o.medicines, encoder);
  encode(o.notes, encoder);
  encode(o.status, encoder);
  encode(o.usage_count, encoder);
  encode(o.max_usage, encoder);
  encode(o.expiry_date, encoder);
  encode(o.issued_at, encoder);
  encode(o.dispensed_at, encoder);
  encode(o.ledger_synced, encoder);
  encode(o.hash_verified, encoder);
}

void decode(offchain_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.short_code, decoder);
  decode(o.doctor, decoder);
  decode(o.patient_name, decoder);
  decode(o.patient_age, decoder);
  decode(o.medicines, decoder);
  decode(o.notes, decoder);
  decode(o.status, decoder);
  decode(o.usage_count, decoder);
  decode(o.max_usage, decoder);
  decode(o.expiry_date, decoder);
  decode(o.issued_at, decoder);
  decode(o.dispensed_at, decoder);
  decode(o.ledger_synced, decoder);
  decode(o.hash_verified, decoder);
}

}  // namespace rxseal::schema
