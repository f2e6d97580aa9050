#pragma once
#include <notary/schema/attestation_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const attestation_record<1>& o, ::scale::Encoder& encoder);
void decode(attestation_record<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
