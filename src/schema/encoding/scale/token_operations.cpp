#include <notary/schema/encoding/scale/token_operations.hpp>

namespace notary::schema {

void encode(const safe_transfer_from<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.from, encoder);
  encode(o.to, encoder);
  encode(o.id, encoder);
  encode_amount(o.amount, encoder);
  encode(o.data, encoder);
}

void decode(safe_transfer_from<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.from, decoder);
  decode(o.to, decoder);
  decode(o.id, decoder);
  decode_amount(o.amount, decoder);
  decode(o.data, decoder);
}

void encode(const safe_batch_transfer_from<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.from, encoder);
  encode(o.to, encoder);
  encode(o.ids, encoder);
  encode_amounts(o.amounts, encoder);
  encode(o.data, encoder);
}

void decode(safe_batch_transfer_from<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.from, decoder);
  decode(o.to, decoder);
  decode(o.ids, decoder);
  decode_amounts(o.amounts, decoder);
  decode(o.data, decoder);
}

void encode(const set_approval_for_all<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.operator_address, encoder);
  encode(o.approved, encoder);
}

void decode(set_approval_for_all<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.operator_address, decoder);
  decode(o.approved, decoder);
}

}  // namespace notary::schema
