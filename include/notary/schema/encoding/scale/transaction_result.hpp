#pragma once
#include <notary/schema/encoding/scale/transaction_event.hpp>
#include <notary/schema/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const transaction_result<1>& o, ::scale::Encoder& encoder);
void decode(transaction_result<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
