#include <explorer/schema/encoding/scale/payload_type.hpp>

#include <stdexcept>

namespace explorer::schema {

void encode(const payload_type_t o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(payload_type_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(payload_type_t::private_payload)) {
    throw std::invalid_argument{"unknown vote plan payload type"};
  }
  o = static_cast<payload_type_t>(raw);
}

}  // namespace explorer::schema
