#pragma once
#include <explorer/schema/certificate.hpp>
#include <explorer/schema/encoding/scale/block_date.hpp>
#include <explorer/schema/encoding/scale/payload_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const tax_ratio& o, ::scale::Encoder& encoder);
void decode(tax_ratio& o, ::scale::Decoder& decoder);

void encode(const tax_type& o, ::scale::Encoder& encoder);
void decode(tax_type& o, ::scale::Decoder& decoder);

void encode(const pool_registration& o, ::scale::Encoder& encoder);
void decode(pool_registration& o, ::scale::Decoder& decoder);

void encode(const pool_retirement& o, ::scale::Encoder& encoder);
void decode(pool_retirement& o, ::scale::Decoder& decoder);

void encode(const pool_update& o, ::scale::Encoder& encoder);
void decode(pool_update& o, ::scale::Decoder& decoder);

void encode(const stake_delegation& o, ::scale::Encoder& encoder);
void decode(stake_delegation& o, ::scale::Decoder& decoder);

void encode(const owner_stake_delegation& o, ::scale::Encoder& encoder);
void decode(owner_stake_delegation& o, ::scale::Decoder& decoder);

void encode(const proposal_definition& o, ::scale::Encoder& encoder);
void decode(proposal_definition& o, ::scale::Decoder& decoder);

void encode(const vote_plan_certificate& o, ::scale::Encoder& encoder);
void decode(vote_plan_certificate& o, ::scale::Decoder& decoder);

void encode(const public_vote_payload& o, ::scale::Encoder& encoder);
void decode(public_vote_payload& o, ::scale::Decoder& decoder);

void encode(const private_vote_payload& o, ::scale::Encoder& encoder);
void decode(private_vote_payload& o, ::scale::Decoder& decoder);

void encode(const vote_cast& o, ::scale::Encoder& encoder);
void decode(vote_cast& o, ::scale::Decoder& decoder);

void encode(const vote_tally& o, ::scale::Encoder& encoder);
void decode(vote_tally& o, ::scale::Decoder& decoder);

void encode(const encrypted_vote_tally& o, ::scale::Encoder& encoder);
void decode(encrypted_vote_tally& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
