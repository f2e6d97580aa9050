#include <notary/schema/encoding/scale/assertion_list_state.hpp>

namespace notary::schema {

void encode(const assertion_list_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.count, encoder);
  encode(o.last_update, encoder);
}

void decode(assertion_list_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.count, decoder);
  decode(o.last_update, decoder);
}

}  // namespace notary::schema
