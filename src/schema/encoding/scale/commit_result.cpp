#include <notary/schema/encoding/scale/commit_result.hpp>

namespace notary::schema {

void encode(const commit_result<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.committed_height, encoder);
  encode(o.state_root, encoder);
}

void decode(commit_result<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.committed_height, decoder);
  decode(o.state_root, decoder);
}

}  // namespace notary::schema
