#pragma once
#include <notary/schema/encoding/scale/primitives.hpp>
#include <notary/schema/tip_operations.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const set_tip_amount<1>& o, ::scale::Encoder& encoder);
void decode(set_tip_amount<1>& o, ::scale::Decoder& decoder);

void encode(const tip_out<1>& o, ::scale::Encoder& encoder);
void decode(tip_out<1>& o, ::scale::Decoder& decoder);

void encode(const deposit<1>& o, ::scale::Encoder& encoder);
void decode(deposit<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
