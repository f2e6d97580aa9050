#pragma once
#include <notary/schema/assertion_operations.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const add_assertion<1>& o, ::scale::Encoder& encoder);
void decode(add_assertion<1>& o, ::scale::Decoder& decoder);

void encode(const set_controller<1>& o, ::scale::Encoder& encoder);
void decode(set_controller<1>& o, ::scale::Decoder& decoder);

void encode(const set_gateway<1>& o, ::scale::Encoder& encoder);
void decode(set_gateway<1>& o, ::scale::Decoder& decoder);

void encode(const stop_assertion<1>& o, ::scale::Encoder& encoder);
void decode(stop_assertion<1>& o, ::scale::Decoder& decoder);

void encode(const unstop_assertion<1>& o, ::scale::Encoder& encoder);
void decode(unstop_assertion<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
