#include <explorer/schema/encoding/scale/transaction.hpp>

namespace explorer::schema {

void encode(const transaction_input& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
  encode(o.address, encoder);
}

void decode(transaction_input& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
  decode(o.address, decoder);
}

void encode(const transaction_output& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
  encode(o.address, encoder);
}

void decode(transaction_output& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
  decode(o.address, decoder);
}

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.inputs, encoder);
  encode(o.outputs, encoder);
  encode(o.certificate, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.inputs, decoder);
  decode(o.outputs, decoder);
  decode(o.certificate, decoder);
}

}  // namespace explorer::schema
