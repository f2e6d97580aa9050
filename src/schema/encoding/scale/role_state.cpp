#include <notary/schema/encoding/scale/role_state.hpp>

namespace notary::schema {

void encode(const role_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.overrider, encoder);
  encode(o.tip_jar, encoder);
  encode_amount(o.tip_amount, encoder);
}

void decode(role_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.overrider, decoder);
  decode(o.tip_jar, decoder);
  decode_amount(o.tip_amount, decoder);
}

}  // namespace notary::schema
