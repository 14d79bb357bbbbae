#pragma once

#include <rxseal/schema/ledger_receipt.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE codec.
namespace rxseal::schema {

void encode(const ledger_receipt<1>& o, ::scale::Encoder& encoder);
void decode(ledger_receipt<1>& o, ::scale::Decoder& decoder);

}  // namespace rxseal::schema
