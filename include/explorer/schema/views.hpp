#pragma once

#include <explorer/schema/block.hpp>
#include <explorer/schema/block_date.hpp>
#include <explorer/schema/certificate.hpp>
#include <explorer/schema/payload_type.hpp>
#include <explorer/schema/primitives.hpp>
#include <explorer/schema/transaction.hpp>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

// Schema type: query views.
// Read API: resolved records returned by the query resolver. Index derived
// fields (confirmation, branch membership, counts) sit beside the stored
// record.
namespace explorer::schema {

struct block_view final {
  block_t block{};
  bool is_confirmed{};
  std::vector<branch_id_t> branches;  // live branches containing the block
};

struct branch_view final {
  branch_id_t id{};
  block_id_t tip{};
  chain_length_t chain_length{};
  block_date date{};
  bool is_main{};
  bool is_live{};
};

struct transaction_view final {
  transaction_t transaction{};
  std::vector<block_id_t> blocks;
};

struct epoch_view final {
  epoch_t id{};
  branch_id_t branch{};
  block_id_t first_block{};
  block_id_t last_block{};
  uint64_t total_blocks{};
};

struct address_view final {
  address_t id;
  std::optional<pool_id_t> delegation;
  value_t balance{};
  uint64_t total_transactions{};
};

struct stake_pool_view final {
  pool_id_t id{};
  pool_registration registration{};
  std::optional<pool_retirement> retirement;
  value_t delegated_stake{};
  uint64_t total_blocks{};
};

/// Half open option range [start, end).
struct option_range final {
  uint8_t start{};
  uint8_t end{};

  bool operator==(const option_range&) const = default;
};

struct tally_public_status final {
  std::vector<weight_t> results;
  option_range options{};
};

struct tally_private_status final {
  std::optional<std::vector<weight_t>> results;  // absent until decrypted
  option_range options{};
};

using tally_status_t = std::variant<tally_public_status, tally_private_status>;

struct proposal_view final {
  external_proposal_id_t external_id{};
  uint8_t index{};
  option_range options{};
  std::optional<tally_status_t> tally;
  uint64_t votes_count{};
};

struct vote_plan_view final {
  vote_plan_id_t id{};
  block_date vote_start{};
  block_date vote_end{};
  block_date committee_end{};
  payload_type_t payload_type{payload_type_t::public_payload};
  std::vector<proposal_view> proposals;
};

}  // namespace explorer::schema
