#include <explorer/schema/encoding/scale/views.hpp>

namespace explorer::schema {

void encode(const block_view& o, ::scale::Encoder& encoder) {
  encode(o.block, encoder);
  encode(o.is_confirmed, encoder);
  encode(o.branches, encoder);
}

void decode(block_view& o, ::scale::Decoder& decoder) {
  decode(o.block, decoder);
  decode(o.is_confirmed, decoder);
  decode(o.branches, decoder);
}

void encode(const branch_view& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
  encode(o.tip, encoder);
  encode(o.chain_length, encoder);
  encode(o.date, encoder);
  encode(o.is_main, encoder);
  encode(o.is_live, encoder);
}

void decode(branch_view& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
  decode(o.tip, decoder);
  decode(o.chain_length, decoder);
  decode(o.date, decoder);
  decode(o.is_main, decoder);
  decode(o.is_live, decoder);
}

void encode(const transaction_view& o, ::scale::Encoder& encoder) {
  encode(o.transaction, encoder);
  encode(o.blocks, encoder);
}

void decode(transaction_view& o, ::scale::Decoder& decoder) {
  decode(o.transaction, decoder);
  decode(o.blocks, decoder);
}

void encode(const epoch_view& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
  encode(o.branch, encoder);
  encode(o.first_block, encoder);
  encode(o.last_block, encoder);
  encode(o.total_blocks, encoder);
}

void decode(epoch_view& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
  decode(o.branch, decoder);
  decode(o.first_block, decoder);
  decode(o.last_block, decoder);
  decode(o.total_blocks, decoder);
}

void encode(const address_view& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
  encode(o.delegation, encoder);
  encode(o.balance, encoder);
  encode(o.total_transactions, encoder);
}

void decode(address_view& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
  decode(o.delegation, decoder);
  decode(o.balance, decoder);
  decode(o.total_transactions, decoder);
}

void encode(const stake_pool_view& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
  encode(o.registration, encoder);
  encode(o.retirement, encoder);
  encode(o.delegated_stake, encoder);
  encode(o.total_blocks, encoder);
}

void decode(stake_pool_view& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
  decode(o.registration, decoder);
  decode(o.retirement, decoder);
  decode(o.delegated_stake, decoder);
  decode(o.total_blocks, decoder);
}

void encode(const option_range& o, ::scale::Encoder& encoder) {
  encode(o.start, encoder);
  encode(o.end, encoder);
}

void decode(option_range& o, ::scale::Decoder& decoder) {
  decode(o.start, decoder);
  decode(o.end, decoder);
}

void encode(const tally_public_status& o, ::scale::Encoder& encoder) {
  encode(o.results, encoder);
  encode(o.options, encoder);
}

void decode(tally_public_status& o, ::scale::Decoder& decoder) {
  decode(o.results, decoder);
  decode(o.options, decoder);
}

void encode(const tally_private_status& o, ::scale::Encoder& encoder) {
  encode(o.results, encoder);
  encode(o.options, encoder);
}

void decode(tally_private_status& o, ::scale::Decoder& decoder) {
  decode(o.results, decoder);
  decode(o.options, decoder);
}

void encode(const proposal_view& o, ::scale::Encoder& encoder) {
  encode(o.external_id, encoder);
  encode(o.index, encoder);
  encode(o.options, encoder);
  encode(o.tally, encoder);
  encode(o.votes_count, encoder);
}

void decode(proposal_view& o, ::scale::Decoder& decoder) {
  decode(o.external_id, decoder);
  decode(o.index, decoder);
  decode(o.options, decoder);
  decode(o.tally, decoder);
  decode(o.votes_count, decoder);
}

void encode(const vote_plan_view& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
  encode(o.vote_start, encoder);
  encode(o.vote_end, encoder);
  encode(o.committee_end, encoder);
  encode(o.payload_type, encoder);
  encode(o.proposals, encoder);
}

void decode(vote_plan_view& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
  decode(o.vote_start, decoder);
  decode(o.vote_end, decoder);
  decode(o.committee_end, decoder);
  decode(o.payload_type, decoder);
  decode(o.proposals, decoder);
}

}  // namespace explorer::schema
