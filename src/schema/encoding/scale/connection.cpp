#include <explorer/schema/encoding/scale/connection.hpp>

namespace explorer::schema {

void encode(const pagination_arguments& o, ::scale::Encoder& encoder) {
  encode(o.first, encoder);
  encode(o.last, encoder);
  encode(o.before, encoder);
  encode(o.after, encoder);
}

void decode(pagination_arguments& o, ::scale::Decoder& decoder) {
  decode(o.first, decoder);
  decode(o.last, decoder);
  decode(o.before, decoder);
  decode(o.after, decoder);
}

void encode(const page_info& o, ::scale::Encoder& encoder) {
  encode(o.has_previous_page, encoder);
  encode(o.has_next_page, encoder);
  encode(o.start_cursor, encoder);
  encode(o.end_cursor, encoder);
}

void decode(page_info& o, ::scale::Decoder& decoder) {
  decode(o.has_previous_page, decoder);
  decode(o.has_next_page, decoder);
  decode(o.start_cursor, decoder);
  decode(o.end_cursor, decoder);
}

}  // namespace explorer::schema
