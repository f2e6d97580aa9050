#pragma once
#include <notary/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <vector>

namespace notary::schema {

// amount_t lives in boost::multiprecision, out of reach of argument-dependent
// lookup, so it is written explicitly as a 32-byte big-endian word.
void encode_amount(const amount_t& amount, ::scale::Encoder& encoder);
void decode_amount(amount_t& amount, ::scale::Decoder& decoder);

void encode_amounts(const std::vector<amount_t>& amounts,
                    ::scale::Encoder& encoder);
void decode_amounts(std::vector<amount_t>& amounts, ::scale::Decoder& decoder);

}  // namespace notary::schema
