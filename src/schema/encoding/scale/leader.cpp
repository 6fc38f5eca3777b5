#include <explorer/schema/encoding/scale/leader.hpp>

namespace explorer::schema {

void encode(const pool_leader& o, ::scale::Encoder& encoder) {
  encode(o.pool_id, encoder);
}

void decode(pool_leader& o, ::scale::Decoder& decoder) {
  decode(o.pool_id, decoder);
}

void encode(const bft_leader& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(bft_leader& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

}  // namespace explorer::schema
