#pragma once
#include <explorer/schema/leader.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const pool_leader& o, ::scale::Encoder& encoder);
void decode(pool_leader& o, ::scale::Decoder& decoder);

void encode(const bft_leader& o, ::scale::Encoder& encoder);
void decode(bft_leader& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
