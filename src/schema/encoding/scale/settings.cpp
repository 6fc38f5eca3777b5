#include <explorer/schema/encoding/scale/settings.hpp>

namespace explorer::schema {

void encode(const per_certificate_fees& o, ::scale::Encoder& encoder) {
  encode(o.pool_registration, encoder);
  encode(o.stake_delegation, encoder);
  encode(o.owner_stake_delegation, encoder);
}

void decode(per_certificate_fees& o, ::scale::Decoder& decoder) {
  decode(o.pool_registration, decoder);
  decode(o.stake_delegation, decoder);
  decode(o.owner_stake_delegation, decoder);
}

void encode(const per_vote_certificate_fees& o, ::scale::Encoder& encoder) {
  encode(o.vote_plan, encoder);
  encode(o.vote_cast, encoder);
}

void decode(per_vote_certificate_fees& o, ::scale::Decoder& decoder) {
  decode(o.vote_plan, decoder);
  decode(o.vote_cast, decoder);
}

void encode(const fee_settings& o, ::scale::Encoder& encoder) {
  encode(o.constant, encoder);
  encode(o.coefficient, encoder);
  encode(o.certificate, encoder);
  encode(o.per_certificate, encoder);
  encode(o.per_vote_certificate, encoder);
}

void decode(fee_settings& o, ::scale::Decoder& decoder) {
  decode(o.constant, decoder);
  decode(o.coefficient, decoder);
  decode(o.certificate, decoder);
  decode(o.per_certificate, decoder);
  decode(o.per_vote_certificate, decoder);
}

void encode(const settings<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.fees, encoder);
  encode(o.epoch_stability_depth, encoder);
}

void decode(settings<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.fees, decoder);
  decode(o.epoch_stability_depth, decoder);
}

}  // namespace explorer::schema
