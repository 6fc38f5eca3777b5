#include <explorer/schema/encoding/scale/stake_pool_state.hpp>

namespace explorer::schema {

void encode(const stake_pool_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.registration, encoder);
  encode(o.retirement, encoder);
  encode(o.delegated_stake, encoder);
}

void decode(stake_pool_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.registration, decoder);
  decode(o.retirement, decoder);
  decode(o.delegated_stake, decoder);
}

}  // namespace explorer::schema
