#pragma once
#include <explorer/schema/encoding/scale/certificate.hpp>
#include <explorer/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const transaction_input& o, ::scale::Encoder& encoder);
void decode(transaction_input& o, ::scale::Decoder& decoder);

void encode(const transaction_output& o, ::scale::Encoder& encoder);
void decode(transaction_output& o, ::scale::Decoder& decoder);

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
