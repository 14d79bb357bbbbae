#pragma once

#include <rxseal/schema/security_event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE codec.
namespace rxseal::schema {

void encode(const security_event_record<1>& o, ::scale::Encoder& encoder);
void decode(security_event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace rxseal::schema
