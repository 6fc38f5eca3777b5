#include <explorer/schema/encoding/scale/certificate.hpp>

#include <stdexcept>
#include <string>

namespace explorer::schema {

namespace {

void require_non_zero(const non_zero_t value, const char* field) {
  if (value == 0) {
    throw std::invalid_argument{std::string{field} + " must be non-zero"};
  }
}

}  // namespace

void encode(const tax_ratio& o, ::scale::Encoder& encoder) {
  encode(o.numerator, encoder);
  encode(o.denominator, encoder);
}

void decode(tax_ratio& o, ::scale::Decoder& decoder) {
  decode(o.numerator, decoder);
  decode(o.denominator, decoder);
  require_non_zero(o.denominator, "tax ratio denominator");
}

void encode(const tax_type& o, ::scale::Encoder& encoder) {
  encode(o.fixed, encoder);
  encode(o.ratio, encoder);
  encode(o.max_limit, encoder);
}

void decode(tax_type& o, ::scale::Decoder& decoder) {
  decode(o.fixed, decoder);
  decode(o.ratio, decoder);
  decode(o.max_limit, decoder);
  if (o.max_limit.has_value()) {
    require_non_zero(*o.max_limit, "tax max limit");
  }
}

void encode(const pool_registration& o, ::scale::Encoder& encoder) {
  encode(o.pool_id, encoder);
  encode(o.start_validity, encoder);
  encode(o.management_threshold, encoder);
  encode(o.owners, encoder);
  encode(o.operators, encoder);
  encode(o.rewards, encoder);
  encode(o.reward_account, encoder);
}

void decode(pool_registration& o, ::scale::Decoder& decoder) {
  decode(o.pool_id, decoder);
  decode(o.start_validity, decoder);
  decode(o.management_threshold, decoder);
  require_non_zero(o.management_threshold, "management threshold");
  decode(o.owners, decoder);
  decode(o.operators, decoder);
  decode(o.rewards, decoder);
  decode(o.reward_account, decoder);
}

void encode(const pool_retirement& o, ::scale::Encoder& encoder) {
  encode(o.pool_id, encoder);
  encode(o.retirement_time, encoder);
}

void decode(pool_retirement& o, ::scale::Decoder& decoder) {
  decode(o.pool_id, decoder);
  decode(o.retirement_time, decoder);
}

void encode(const pool_update& o, ::scale::Encoder& encoder) {
  encode(o.pool_id, encoder);
  encode(o.registration, encoder);
}

void decode(pool_update& o, ::scale::Decoder& decoder) {
  decode(o.pool_id, decoder);
  decode(o.registration, decoder);
}

void encode(const stake_delegation& o, ::scale::Encoder& encoder) {
  encode(o.account, encoder);
  encode(o.pool_id, encoder);
}

void decode(stake_delegation& o, ::scale::Decoder& decoder) {
  decode(o.account, decoder);
  decode(o.pool_id, decoder);
}

void encode(const owner_stake_delegation& o, ::scale::Encoder& encoder) {
  encode(o.pool_id, encoder);
}

void decode(owner_stake_delegation& o, ::scale::Decoder& decoder) {
  decode(o.pool_id, decoder);
}

void encode(const proposal_definition& o, ::scale::Encoder& encoder) {
  encode(o.external_id, encoder);
  encode(o.options, encoder);
}

void decode(proposal_definition& o, ::scale::Decoder& decoder) {
  decode(o.external_id, decoder);
  decode(o.options, decoder);
  require_non_zero(o.options, "proposal option count");
}

void encode(const vote_plan_certificate& o, ::scale::Encoder& encoder) {
  encode(o.vote_plan_id, encoder);
  encode(o.vote_start, encoder);
  encode(o.vote_end, encoder);
  encode(o.committee_end, encoder);
  encode(o.payload_type, encoder);
  encode(o.proposals, encoder);
}

void decode(vote_plan_certificate& o, ::scale::Decoder& decoder) {
  decode(o.vote_plan_id, decoder);
  decode(o.vote_start, decoder);
  decode(o.vote_end, decoder);
  decode(o.committee_end, decoder);
  decode(o.payload_type, decoder);
  decode(o.proposals, decoder);
  if (o.proposals.size() > kMaxProposalsPerPlan) {
    throw std::invalid_argument{"vote plan has " +
                                std::to_string(o.proposals.size()) +
                                " proposals"};
  }
}

void encode(const public_vote_payload& o, ::scale::Encoder& encoder) {
  encode(o.choice, encoder);
}

void decode(public_vote_payload& o, ::scale::Decoder& decoder) {
  decode(o.choice, decoder);
}

void encode(const private_vote_payload& o, ::scale::Encoder& encoder) {
  encode(o.encrypted_vote, encoder);
  encode(o.proof, encoder);
}

void decode(private_vote_payload& o, ::scale::Decoder& decoder) {
  decode(o.encrypted_vote, decoder);
  decode(o.proof, decoder);
}

void encode(const vote_cast& o, ::scale::Encoder& encoder) {
  encode(o.vote_plan_id, encoder);
  encode(o.proposal_index, encoder);
  encode(o.payload, encoder);
}

void decode(vote_cast& o, ::scale::Decoder& decoder) {
  decode(o.vote_plan_id, decoder);
  decode(o.proposal_index, decoder);
  decode(o.payload, decoder);
}

void encode(const vote_tally& o, ::scale::Encoder& encoder) {
  encode(o.vote_plan_id, encoder);
  encode(o.results, encoder);
}

void decode(vote_tally& o, ::scale::Decoder& decoder) {
  decode(o.vote_plan_id, decoder);
  decode(o.results, decoder);
}

void encode(const encrypted_vote_tally& o, ::scale::Encoder& encoder) {
  encode(o.vote_plan_id, encoder);
}

void decode(encrypted_vote_tally& o, ::scale::Decoder& decoder) {
  decode(o.vote_plan_id, decoder);
}

}  // namespace explorer::schema
