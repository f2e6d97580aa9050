#pragma once
#include <notary/schema/encoding/scale/assertion_operations.hpp>
#include <notary/schema/encoding/scale/attestation_operations.hpp>
#include <notary/schema/encoding/scale/role_operations.hpp>
#include <notary/schema/encoding/scale/tip_operations.hpp>
#include <notary/schema/encoding/scale/token_operations.hpp>
#include <notary/schema/encoding/scale/primitives.hpp>
#include <notary/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
