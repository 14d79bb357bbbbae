#pragma once

#include <rxseal/schema/ledger_call.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE codec.
namespace rxseal::schema {

void encode(const ledger_call<1>& o, ::scale::Encoder& encoder);
void decode(ledger_call<1>& o, ::scale::Decoder& decoder);

}  // namespace rxseal::schema
