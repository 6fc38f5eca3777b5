#include <explorer/schema/encoding/scale/address_state.hpp>

namespace explorer::schema {

void encode(const address_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
  encode(o.delegation, encoder);
  encode(o.balance, encoder);
}

void decode(address_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
  decode(o.delegation, decoder);
  decode(o.balance, decoder);
}

}  // namespace explorer::schema
