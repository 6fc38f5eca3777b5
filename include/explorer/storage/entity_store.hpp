#pragma once

#include <explorer/schema/address_state.hpp>
#include <explorer/schema/block.hpp>
#include <explorer/schema/encoding/scale/encoder.hpp>
#include <explorer/schema/primitives.hpp>
#include <explorer/schema/stake_pool_state.hpp>
#include <explorer/schema/transaction.hpp>
#include <explorer/schema/vote_plan_state.hpp>
#include <explorer/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace explorer::storage {

/// One ingestion log entry: sequence number and the block it linked.
using ingest_log_entry_t = std::pair<uint64_t, explorer::schema::block_id_t>;

class aggregate_batch;

/// Typed, durable mapping from identifiers to explorer records.
///
/// Blocks and transactions are append-only; pools, vote plans, votes and
/// addresses are aggregate state rewritten as certificates are ingested.
/// Every read decodes a single record; a record that fails to decode raises
/// `explorer::common::internal_consistency_error` for that record only.
class entity_store final {
 public:
  explicit entity_store(std::string_view path,
                        const storage_options& options = {});

  entity_store(const entity_store&) = delete;
  entity_store& operator=(const entity_store&) = delete;

  /// Persist block, its transactions and the ingestion log entry in one
  /// write batch. Re-applying identical content is a no-op in effect.
  void put_applied(const explorer::schema::block_t& block,
                   const std::vector<explorer::schema::transaction_t>& txs,
                   uint64_t sequence);

  /// Persist every staged aggregate record together with the marker for
  /// ingestion log entry `sequence`, in one write batch.
  void commit_aggregates(const aggregate_batch& batch, uint64_t sequence);

  /// True once the aggregates of ingestion log entry `sequence` are durable.
  bool aggregates_applied(uint64_t sequence) const;

  std::optional<explorer::schema::block_t> get_block(
      const explorer::schema::block_id_t& id) const;
  std::optional<explorer::schema::transaction_t> get_transaction(
      const explorer::schema::transaction_id_t& id) const;
  std::optional<explorer::schema::stake_pool_state_t> get_stake_pool(
      const explorer::schema::pool_id_t& id) const;
  std::optional<explorer::schema::vote_plan_state_t> get_vote_plan(
      const explorer::schema::vote_plan_id_t& id) const;
  std::optional<explorer::schema::vote_record> get_vote(
      const explorer::schema::vote_plan_id_t& plan,
      uint8_t proposal_index,
      uint64_t vote_index) const;
  std::optional<explorer::schema::address_state_t> get_address(
      const explorer::schema::address_t& address) const;

  /// Every ingestion log entry in sequence order.
  std::vector<ingest_log_entry_t> list_ingested() const;

 private:
  using encoder_t = explorer::schema::encoding::encoder<
      explorer::schema::encoding::scale_encoder_tag>;

  mutable encoder_t encoder_;
  storage<rocksdb_storage_tag> storage_;
};

/// Aggregate records staged in memory until `entity_store::commit_aggregates`.
/// Reads see the staged record first and fall back to the store.
class aggregate_batch final {
 public:
  explicit aggregate_batch(const entity_store& store) : store_{store} {}

  std::optional<explorer::schema::stake_pool_state_t> get_stake_pool(
      const explorer::schema::pool_id_t& id) const;
  void put_stake_pool(const explorer::schema::stake_pool_state_t& pool);

  std::optional<explorer::schema::vote_plan_state_t> get_vote_plan(
      const explorer::schema::vote_plan_id_t& id) const;
  void put_vote_plan(const explorer::schema::vote_plan_state_t& plan);

  void put_vote(const explorer::schema::vote_plan_id_t& plan,
                uint8_t proposal_index,
                uint64_t vote_index,
                const explorer::schema::vote_record& vote);

  std::optional<explorer::schema::address_state_t> get_address(
      const explorer::schema::address_t& address) const;
  void put_address(const explorer::schema::address_state_t& address);

  bool empty() const {
    return pools_.empty() && plans_.empty() && votes_.empty() &&
           addresses_.empty();
  }

 private:
  friend class entity_store;

  using vote_key_t =
      std::tuple<explorer::schema::vote_plan_id_t, uint8_t, uint64_t>;

  const entity_store& store_;
  std::map<explorer::schema::pool_id_t, explorer::schema::stake_pool_state_t>
      pools_;
  std::map<explorer::schema::vote_plan_id_t,
           explorer::schema::vote_plan_state_t>
      plans_;
  std::map<vote_key_t, explorer::schema::vote_record> votes_;
  std::map<explorer::schema::address_t, explorer::schema::address_state_t>
      addresses_;
};

}  // namespace explorer::storage
