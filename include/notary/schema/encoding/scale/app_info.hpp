#pragma once
#include <notary/schema/app_info.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const app_info<1>& o, ::scale::Encoder& encoder);
void decode(app_info<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
