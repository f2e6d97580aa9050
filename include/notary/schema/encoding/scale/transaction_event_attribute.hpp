#pragma once
#include <notary/schema/transaction_event_attribute.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const transaction_event_attribute<1>& o, ::scale::Encoder& encoder);
void decode(transaction_event_attribute<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
