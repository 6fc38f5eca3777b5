#pragma once
#include <explorer/schema/encoding/scale/block.hpp>
#include <explorer/schema/encoding/scale/block_date.hpp>
#include <explorer/schema/encoding/scale/certificate.hpp>
#include <explorer/schema/encoding/scale/payload_type.hpp>
#include <explorer/schema/encoding/scale/transaction.hpp>
#include <explorer/schema/views.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace explorer::schema {

void encode(const block_view& o, ::scale::Encoder& encoder);
void decode(block_view& o, ::scale::Decoder& decoder);

void encode(const branch_view& o, ::scale::Encoder& encoder);
void decode(branch_view& o, ::scale::Decoder& decoder);

void encode(const transaction_view& o, ::scale::Encoder& encoder);
void decode(transaction_view& o, ::scale::Decoder& decoder);

void encode(const epoch_view& o, ::scale::Encoder& encoder);
void decode(epoch_view& o, ::scale::Decoder& decoder);

void encode(const address_view& o, ::scale::Encoder& encoder);
void decode(address_view& o, ::scale::Decoder& decoder);

void encode(const stake_pool_view& o, ::scale::Encoder& encoder);
void decode(stake_pool_view& o, ::scale::Decoder& decoder);

void encode(const option_range& o, ::scale::Encoder& encoder);
void decode(option_range& o, ::scale::Decoder& decoder);

void encode(const tally_public_status& o, ::scale::Encoder& encoder);
void decode(tally_public_status& o, ::scale::Decoder& decoder);

void encode(const tally_private_status& o, ::scale::Encoder& encoder);
void decode(tally_private_status& o, ::scale::Decoder& decoder);

void encode(const proposal_view& o, ::scale::Encoder& encoder);
void decode(proposal_view& o, ::scale::Decoder& decoder);

void encode(const vote_plan_view& o, ::scale::Encoder& encoder);
void decode(vote_plan_view& o, ::scale::Decoder& decoder);

}  // namespace explorer::schema
