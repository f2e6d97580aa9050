#include <notary/schema/encoding/scale/attestation_record.hpp>

namespace notary::schema {

void encode(const attestation_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.signed_at, encoder);
  encode(o.revoked, encoder);
}

void decode(attestation_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.signed_at, decoder);
  decode(o.revoked, decoder);
}

}  // namespace notary::schema
