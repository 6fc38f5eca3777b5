#pragma once
#include <explorer/schema/block_date.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const block_date& o, ::scale::Encoder& encoder);
void decode(block_date& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
