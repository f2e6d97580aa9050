#pragma once
#include <notary/schema/attestation_operations.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const attest<1>& o, ::scale::Encoder& encoder);
void decode(attest<1>& o, ::scale::Decoder& decoder);

void encode(const revoke<1>& o, ::scale::Encoder& encoder);
void decode(revoke<1>& o, ::scale::Decoder& decoder);

void encode(const force_attest<1>& o, ::scale::Encoder& encoder);
void decode(force_attest<1>& o, ::scale::Decoder& decoder);

void encode(const force_revoke<1>& o, ::scale::Encoder& encoder);
void decode(force_revoke<1>& o, ::scale::Decoder& decoder);

void encode(const block_address<1>& o, ::scale::Encoder& encoder);
void decode(block_address<1>& o, ::scale::Decoder& decoder);

void encode(const unblock_address<1>& o, ::scale::Encoder& encoder);
void decode(unblock_address<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
