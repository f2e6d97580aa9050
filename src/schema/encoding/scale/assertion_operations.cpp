#include <notary/schema/encoding/scale/assertion_operations.hpp>

namespace notary::schema {

void encode(const add_assertion<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.text, encoder);
  encode(o.freshness_window, encoder);
  encode(o.expiry_window, encoder);
  encode(o.requires_gateway, encoder);
  encode(o.gateway, encoder);
  encode(o.controller, encoder);
}

void decode(add_assertion<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.text, decoder);
  decode(o.freshness_window, decoder);
  decode(o.expiry_window, decoder);
  decode(o.requires_gateway, decoder);
  decode(o.gateway, decoder);
  decode(o.controller, decoder);
}

void encode(const set_controller<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.assertion_id, encoder);
  encode(o.controller, encoder);
}

void decode(set_controller<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.assertion_id, decoder);
  decode(o.controller, decoder);
}

void encode(const set_gateway<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.assertion_id, encoder);
  encode(o.gateway, encoder);
}

void decode(set_gateway<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.assertion_id, decoder);
  decode(o.gateway, decoder);
}

void encode(const stop_assertion<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.assertion_id, encoder);
}

void decode(stop_assertion<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.assertion_id, decoder);
}

void encode(const unstop_assertion<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.assertion_id, encoder);
}

void decode(unstop_assertion<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.assertion_id, decoder);
}

}  // namespace notary::schema
