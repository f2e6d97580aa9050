#pragma once
#include <notary/schema/role_operations.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder);
void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder);

void encode(const renounce_ownership<1>& o, ::scale::Encoder& encoder);
void decode(renounce_ownership<1>& o, ::scale::Decoder& decoder);

void encode(const set_overrider<1>& o, ::scale::Encoder& encoder);
void decode(set_overrider<1>& o, ::scale::Decoder& decoder);

void encode(const set_tip_jar<1>& o, ::scale::Encoder& encoder);
void decode(set_tip_jar<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
