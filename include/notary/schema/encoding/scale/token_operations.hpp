#pragma once
#include <notary/schema/encoding/scale/primitives.hpp>
#include <notary/schema/token_operations.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const safe_transfer_from<1>& o, ::scale::Encoder& encoder);
void decode(safe_transfer_from<1>& o, ::scale::Decoder& decoder);

void encode(const safe_batch_transfer_from<1>& o, ::scale::Encoder& encoder);
void decode(safe_batch_transfer_from<1>& o, ::scale::Decoder& decoder);

void encode(const set_approval_for_all<1>& o, ::scale::Encoder& encoder);
void decode(set_approval_for_all<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
