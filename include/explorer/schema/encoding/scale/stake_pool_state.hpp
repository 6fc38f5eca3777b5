#pragma once
#include <explorer/schema/encoding/scale/certificate.hpp>
#include <explorer/schema/stake_pool_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const stake_pool_state<1>& o, ::scale::Encoder& encoder);
void decode(stake_pool_state<1>& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
