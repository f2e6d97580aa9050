#include <notary/schema/encoding/scale/primitives.hpp>

#include <algorithm>
#include <iterator>

namespace notary::schema {

void encode_amount(const amount_t& amount, ::scale::Encoder& encoder) {
  encode(to_word(amount), encoder);
}

void decode_amount(amount_t& amount, ::scale::Decoder& decoder) {
  auto word = hash32_t{};
  decode(word, decoder);
  amount = from_word(word);
}

void encode_amounts(const std::vector<amount_t>& amounts,
                    ::scale::Encoder& encoder) {
  auto words = std::vector<hash32_t>{};
  words.reserve(amounts.size());
  std::ranges::transform(amounts, std::back_inserter(words),
                         [](const amount_t& amount) { return to_word(amount); });
  encode(words, encoder);
}

void decode_amounts(std::vector<amount_t>& amounts, ::scale::Decoder& decoder) {
  auto words = std::vector<hash32_t>{};
  decode(words, decoder);
  amounts.clear();
  amounts.reserve(words.size());
  std::ranges::transform(words, std::back_inserter(amounts),
                         [](const hash32_t& word) { return from_word(word); });
}

}  // namespace notary::schema
