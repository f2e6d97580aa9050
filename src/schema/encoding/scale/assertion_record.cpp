#include <notary/schema/encoding/scale/assertion_record.hpp>

namespace notary::schema {

void encode(const assertion_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.text, encoder);
  encode(o.assertion_id, encoder);
  encode(o.revoke_id, encoder);
  encode(o.freshness_window, encoder);
  encode(o.expiry_window, encoder);
  encode(o.requires_gateway, encoder);
  encode(o.gateway, encoder);
  encode(o.controller, encoder);
  encode(o.stopped, encoder);
}

void decode(assertion_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.text, decoder);
  decode(o.assertion_id, decoder);
  decode(o.revoke_id, decoder);
  decode(o.freshness_window, decoder);
  decode(o.expiry_window, decoder);
  decode(o.requires_gateway, decoder);
  decode(o.gateway, decoder);
  decode(o.controller, decoder);
  decode(o.stopped, decoder);
}

}  // namespace notary::schema
