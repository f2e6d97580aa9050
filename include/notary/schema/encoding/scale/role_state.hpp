#pragma once
#include <notary/schema/encoding/scale/primitives.hpp>
#include <notary/schema/role_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const role_state<1>& o, ::scale::Encoder& encoder);
void decode(role_state<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
