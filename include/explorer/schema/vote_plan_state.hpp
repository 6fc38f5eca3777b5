#pragma once

#include <explorer/schema/block_date.hpp>
#include <explorer/schema/certificate.hpp>
#include <explorer/schema/payload_type.hpp>
#include <explorer/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: vote plan state.
// Ledger view: mutable aggregate of a vote plan. Cast votes are stored as
// separate `vote_record`s keyed by (plan, proposal, index); a proposal only
// keeps the count.
namespace explorer::schema {

struct proposal_state final {
  external_proposal_id_t external_id{};
  uint8_t options{};
  std::optional<std::vector<weight_t>> tally_results;
  uint64_t votes_count{};
};

template <uint16_t Version>
struct vote_plan_state;

template <>
struct vote_plan_state<1> final {
  uint16_t version{1};
  vote_plan_id_t id{};
  block_date vote_start{};
  block_date vote_end{};
  block_date committee_end{};
  payload_type_t payload_type{payload_type_t::public_payload};
  std::vector<proposal_state> proposals;
  bool encrypted_tally_started{};
};

using vote_plan_state_t = vote_plan_state<1>;

struct vote_record final {
  address_t address;
  vote_payload_t payload{};

  bool operator==(const vote_record&) const = default;
};

}  // namespace explorer::schema
