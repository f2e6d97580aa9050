#pragma once
#include <notary/schema/assertion_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const assertion_record<1>& o, ::scale::Encoder& encoder);
void decode(assertion_record<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
