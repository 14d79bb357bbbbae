#include <rxseal/schema/encoding/scale/ledger_operations.hpp>

namespace rxseal::schema {

void encode(const register_doctor<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account, encoder);
}

void decode(register_doctor<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account, decoder);
}

void encode(const register_pharmacy<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account, encoder);
}

void decode(register_pharmacy<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account, decoder);
}

void encode(const issue_prescription<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.patient_hash, encoder);
  encode(o.medication_hash, encoder);
  encode(o.quantity, encoder);
  encode(o.expiry_date, encoder);
  encode(o.max_usage, encoder);
}

void decode(issue_prescription<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.patient_hash, decoder);
  decode(o.medication_hash, decoder);
  decode(o.quantity, decoder);
  decode(o.expiry_date, decoder);
  decode(o.max_usage, decoder);
}

void encode(const dispense_prescription<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
}

void decode(dispense_prescription<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
}

void encode(const set_patient_commitment<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.commitment, encoder);
}

void decode(set_patient_commitment<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.commitment, decoder);
}

}  // namespace rxseal::schema
