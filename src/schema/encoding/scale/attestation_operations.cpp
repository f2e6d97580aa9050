#include <notary/schema/encoding/scale/attestation_operations.hpp>

namespace notary::schema {

void encode(const attest<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.assertion_id, encoder);
  encode(o.subject, encoder);
  encode(o.signed_at, encoder);
  encode(o.signature, encoder);
}

void decode(attest<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.assertion_id, decoder);
  decode(o.subject, decoder);
  decode(o.signed_at, decoder);
  decode(o.signature, decoder);
}

void encode(const revoke<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.assertion_id, encoder);
  encode(o.subject, encoder);
  encode(o.signed_at, encoder);
  encode(o.signature, encoder);
}

void decode(revoke<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.assertion_id, decoder);
  decode(o.subject, decoder);
  decode(o.signed_at, decoder);
  decode(o.signature, decoder);
}

void encode(const force_attest<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.assertion_id, encoder);
  encode(o.subject, encoder);
  encode(o.signed_at, encoder);
}

void decode(force_attest<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.assertion_id, decoder);
  decode(o.subject, decoder);
  decode(o.signed_at, decoder);
}

void encode(const force_revoke<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.assertion_id, encoder);
  encode(o.subject, encoder);
}

void decode(force_revoke<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.assertion_id, decoder);
  decode(o.subject, decoder);
}

void encode(const block_address<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
}

void decode(block_address<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
}

void encode(const unblock_address<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
}

void decode(unblock_address<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
}

}  // namespace notary::schema
