#pragma once
#include <explorer/schema/block.hpp>
#include <explorer/schema/encoding/scale/block_date.hpp>
#include <explorer/schema/encoding/scale/leader.hpp>
#include <explorer/schema/encoding/scale/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const applied_block<1>& o, ::scale::Encoder& encoder);
void decode(applied_block<1>& o, ::scale::Decoder& decoder);

void encode(const block<1>& o, ::scale::Encoder& encoder);
void decode(block<1>& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
