#pragma once
#include <explorer/schema/settings.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const per_certificate_fees& o, ::scale::Encoder& encoder);
void decode(per_certificate_fees& o, ::scale::Decoder& decoder);

void encode(const per_vote_certificate_fees& o, ::scale::Encoder& encoder);
void decode(per_vote_certificate_fees& o, ::scale::Decoder& decoder);

void encode(const fee_settings& o, ::scale::Encoder& encoder);
void decode(fee_settings& o, ::scale::Decoder& decoder);

void encode(const settings<1>& o, ::scale::Encoder& encoder);
void decode(settings<1>& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
