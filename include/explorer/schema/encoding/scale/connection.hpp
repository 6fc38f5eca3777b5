#pragma once
#include <explorer/schema/connection.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const pagination_arguments& o, ::scale::Encoder& encoder);
void decode(pagination_arguments& o, ::scale::Decoder& decoder);

void encode(const page_info& o, ::scale::Encoder& encoder);
void decode(page_info& o, ::scale::Decoder& decoder);

template <typename T>
void encode(const edge<T>& o, ::scale::Encoder& encoder) {
  encode(o.node, encoder);
  encode(o.cursor, encoder);
  encode(o.error, encoder);
}

template <typename T>
void decode(edge<T>& o, ::scale::Decoder& decoder) {
  decode(o.node, decoder);
  decode(o.cursor, decoder);
  decode(o.error, decoder);
}

template <typename T>
void encode(const connection<T>& o, ::scale::Encoder& encoder) {
  encode(o.edges, encoder);
  encode(o.page, encoder);
  encode(o.total_count, encoder);
}

template <typename T>
void decode(connection<T>& o, ::scale::Decoder& decoder) {
  decode(o.edges, decoder);
  decode(o.page, decoder);
  decode(o.total_count, decoder);
}

}  // namespace explorer::schema
