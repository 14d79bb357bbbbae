#pragma once

#include <rxseal/schema/offchain_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE codec.
namespace rxseal::schema {

void encode(const medicine_entry<1>& o, ::scale::Encoder& encoder);
void decode(medicine_entry<1>& o, ::scale::Decoder& decoder);
void encode(const offchain_record<1>& o, ::scale::Encoder& encoder);
void decode(offchain_record<1>& o, ::scale::Decoder& decoder);

}  // namespace rxseal::schema
