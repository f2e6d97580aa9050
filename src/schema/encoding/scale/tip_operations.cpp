#include <notary/schema/encoding/scale/tip_operations.hpp>

namespace notary::schema {

void encode(const set_tip_amount<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_amount(o.tip_amount, encoder);
}

void decode(set_tip_amount<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode_amount(o.tip_amount, decoder);
}

void encode(const tip_out<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(tip_out<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const deposit<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(deposit<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

}  // namespace notary::schema
