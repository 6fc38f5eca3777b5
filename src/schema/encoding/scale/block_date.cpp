#include <explorer/schema/encoding/scale/block_date.hpp>

namespace explorer::schema {

void encode(const block_date& o, ::scale::Encoder& encoder) {
  encode(o.epoch, encoder);
  encode(o.slot, encoder);
}

void decode(block_date& o, ::scale::Decoder& decoder) {
  decode(o.epoch, decoder);
  decode(o.slot, decoder);
}

}  // namespace explorer::schema
