#pragma once
#include <notary/schema/block_result.hpp>
#include <notary/schema/encoding/scale/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const block_result<1>& o, ::scale::Encoder& encoder);
void decode(block_result<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
