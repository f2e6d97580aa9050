#pragma once
#include <notary/schema/assertion_list_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const assertion_list_state<1>& o, ::scale::Encoder& encoder);
void decode(assertion_list_state<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
