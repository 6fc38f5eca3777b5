#pragma once
#include <explorer/schema/payload_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const payload_type_t o, ::scale::Encoder& encoder);
void decode(payload_type_t& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
