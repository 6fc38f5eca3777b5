#pragma once

#include <explorer/schema/block_date.hpp>
#include <explorer/schema/leader.hpp>
#include <explorer/schema/primitives.hpp>
#include <explorer/schema/transaction.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: block.
// Ledger view: `applied_block` is one element of the ledger feed. `block` is
// the immutable record the index stores once the chain length is known.
namespace explorer::schema {

template <uint16_t Version>
struct applied_block;

template <>
struct applied_block<1> final {
  uint16_t version{1};
  block_id_t id{};
  std::optional<block_id_t> parent_id;
  block_date date{};
  uint64_t score{};  // ledger tie-break between equal chain lengths
  std::optional<leader_t> leader;
  std::optional<value_t> treasury;
  std::vector<transaction_t> transactions;
};

using applied_block_t = applied_block<1>;

template <uint16_t Version>
struct block;

template <>
struct block<1> final {
  uint16_t version{1};
  block_id_t id{};
  std::optional<block_id_t> parent_id;
  block_date date{};
  chain_length_t chain_length{};
  uint64_t score{};
  value_t total_input{};
  value_t total_output{};
  std::optional<leader_t> leader;
  std::optional<value_t> treasury;
  std::vector<transaction_id_t> transactions;

  bool operator==(const block<1>&) const = default;
};

using block_t = block<1>;

block_t make_block(const applied_block_t& applied, chain_length_t chain_length);

}  // namespace explorer::schema
