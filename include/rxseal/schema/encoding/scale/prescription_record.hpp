#pragma once

#include <rxseal/schema/prescription_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE codec.
namespace rxseal::schema {

void encode(const prescription_record<1>& o, ::scale::Encoder& encoder);
void decode(prescription_record<1>& o, ::scale::Decoder& decoder);

}  // namespace rxseal::schema
