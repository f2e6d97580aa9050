#include <notary/schema/encoding/scale/transaction.hpp>

namespace notary::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.sender, encoder);
  encode_amount(o.value, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.sender, decoder);
  decode_amount(o.value, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace notary::schema
