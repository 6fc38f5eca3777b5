#include <explorer/schema/encoding/scale/vote_plan_state.hpp>

namespace explorer::schema {

void encode(const proposal_state& o, ::scale::Encoder& encoder) {
  encode(o.external_id, encoder);
  encode(o.options, encoder);
  encode(o.tally_results, encoder);
  encode(o.votes_count, encoder);
}

void decode(proposal_state& o, ::scale::Decoder& decoder) {
  decode(o.external_id, decoder);
  decode(o.options, decoder);
  decode(o.tally_results, decoder);
  decode(o.votes_count, decoder);
}

void encode(const vote_plan_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.vote_start, encoder);
  encode(o.vote_end, encoder);
  encode(o.committee_end, encoder);
  encode(o.payload_type, encoder);
  encode(o.proposals, encoder);
  encode(o.encrypted_tally_started, encoder);
}

void decode(vote_plan_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.vote_start, decoder);
  decode(o.vote_end, decoder);
  decode(o.committee_end, decoder);
  decode(o.payload_type, decoder);
  decode(o.proposals, decoder);
  decode(o.encrypted_tally_started, decoder);
}

void encode(const vote_record& o, ::scale::Encoder& encoder) {
  encode(o.address, encoder);
  encode(o.payload, encoder);
}

void decode(vote_record& o, ::scale::Decoder& decoder) {
  decode(o.address, decoder);
  decode(o.payload, decoder);
}

}  // namespace explorer::schema
