#include <explorer/schema/encoding/scale/block.hpp>

namespace explorer::schema {

void encode(const applied_block<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.parent_id, encoder);
  encode(o.date, encoder);
  encode(o.score, encoder);
  encode(o.leader, encoder);
  encode(o.treasury, encoder);
  encode(o.transactions, encoder);
}

void decode(applied_block<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.parent_id, decoder);
  decode(o.date, decoder);
  decode(o.score, decoder);
  decode(o.leader, decoder);
  decode(o.treasury, decoder);
  decode(o.transactions, decoder);
}

void encode(const block<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.parent_id, encoder);
  encode(o.date, encoder);
  encode(o.chain_length, encoder);
  encode(o.score, encoder);
  encode(o.total_input, encoder);
  encode(o.total_output, encoder);
  encode(o.leader, encoder);
  encode(o.treasury, encoder);
  encode(o.transactions, encoder);
}

void decode(block<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.parent_id, decoder);
  decode(o.date, decoder);
  decode(o.chain_length, decoder);
  decode(o.score, decoder);
  decode(o.total_input, decoder);
  decode(o.total_output, decoder);
  decode(o.leader, decoder);
  decode(o.treasury, decoder);
  decode(o.transactions, decoder);
}

}  // namespace explorer::schema
