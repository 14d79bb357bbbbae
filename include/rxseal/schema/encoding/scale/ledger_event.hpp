#pragma once

#include <rxseal/schema/ledger_event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE codec.
namespace rxseal::schema {

void encode(const ledger_event_attribute<1>& o, ::scale::Encoder& encoder);
void decode(ledger_event_attribute<1>& o, ::scale::Decoder& decoder);
void encode(const ledger_event<1>& o, ::scale::Encoder& encoder);
void decode(ledger_event<1>& o, ::scale::Decoder& decoder);
void encode(const ledger_event_record<1>& o, ::scale::Encoder& encoder);
void decode(ledger_event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace rxseal::schema
