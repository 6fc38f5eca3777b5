#pragma once
#include <explorer/schema/address_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const address_state<1>& o, ::scale::Encoder& encoder);
void decode(address_state<1>& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
