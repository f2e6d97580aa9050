#include <notary/schema/encoding/scale/role_operations.hpp>

namespace notary::schema {

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.new_owner, decoder);
}

void encode(const renounce_ownership<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(renounce_ownership<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const set_overrider<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.overrider, encoder);
}

void decode(set_overrider<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.overrider, decoder);
}

void encode(const set_tip_jar<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.tip_jar, encoder);
}

void decode(set_tip_jar<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.tip_jar, decoder);
}

}  // namespace notary::schema
