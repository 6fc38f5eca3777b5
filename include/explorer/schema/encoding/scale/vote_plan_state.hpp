#pragma once
#include <explorer/schema/encoding/scale/block_date.hpp>
#include <explorer/schema/encoding/scale/certificate.hpp>
#include <explorer/schema/encoding/scale/payload_type.hpp>
#include <explorer/schema/vote_plan_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const proposal_state& o, ::scale::Encoder& encoder);
void decode(proposal_state& o, ::scale::Decoder& decoder);

void encode(const vote_plan_state<1>& o, ::scale::Encoder& encoder);
void decode(vote_plan_state<1>& o, ::scale::Decoder& decoder);

void encode(const vote_record& o, ::scale::Encoder& encoder);
void decode(vote_record& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
