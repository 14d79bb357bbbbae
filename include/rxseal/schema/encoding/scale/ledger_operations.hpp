#pragma once

#include <rxseal/schema/ledger_operations.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE codec.
namespace rxseal::schema {

void encode(const register_doctor<1>& o, ::scale::Encoder& encoder);
void decode(register_doctor<1>& o, ::scale::Decoder& decoder);
void encode(const register_pharmacy<1>& o, ::scale::Encoder& encoder);
void decode(register_pharmacy<1>& o, ::scale::Decoder& decoder);
void encode(const issue_prescription<1>& o, ::scale::Encoder& encoder);
void decode(issue_prescription<1>& o, ::scale::Decoder& decoder);
void encode(const dispense_prescription<1>& o, ::scale::Encoder& encoder);
void decode(dispense_prescription<1>& o, ::scale::Decoder& decoder);
void encode(const set_patient_commitment<1>& o, ::scale::Encoder& encoder);
void decode(set_patient_commitment<1>& o, ::scale::Decoder& decoder);

}  // namespace rxseal::schema
