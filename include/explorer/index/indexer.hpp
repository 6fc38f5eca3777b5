#pragma once

#include <explorer/index/block_dag.hpp>
#include <explorer/index/branch_tracker.hpp>
#include <explorer/index/orphan_pool.hpp>
#include <explorer/schema/block.hpp>
#include <explorer/schema/ingest_status.hpp>
#include <explorer/schema/primitives.hpp>
#include <explorer/schema/transaction.hpp>
#include <explorer/schema/views.hpp>
#include <explorer/storage/entity_store.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace explorer::index {

struct indexer_options final {
  uint32_t epoch_stability_depth{10};
  std::optional<uint32_t> retention_window;  // epoch_stability_depth if unset
  std::size_t max_orphans{1024};
  ledger_order_t ledger_order{default_ledger_order};
};

struct ingest_result final {
  explorer::schema::ingest_status_t status{
      explorer::schema::ingest_status_t::orphan};
  std::string log;
  /// Every block linked by this call: the block itself and any buffered
  /// descendants it released.
  std::vector<explorer::schema::block_id_t> linked;
};

/// Invoked with the new main branch tip whenever main changes.
using tip_listener_t = std::function<void(const explorer::schema::branch_view&)>;

/// In-memory read model guarded by the indexer's shared mutex.
///
/// Secondary sequences are append-only and global (all branches), in
/// ingestion order, so positions handed out as cursors never shift.
struct index_state final {
  index_state(uint32_t epoch_stability_depth,
              uint32_t retention_window,
              ledger_order_t order);

  index_state(const index_state&) = delete;
  index_state& operator=(const index_state&) = delete;

  block_dag dag;
  branch_tracker tracker;
  std::unordered_map<explorer::schema::transaction_id_t,
                     std::vector<explorer::schema::block_id_t>,
                     explorer::schema::hash32_hasher>
      transaction_blocks;
  std::unordered_map<explorer::schema::address_t,
                     std::vector<explorer::schema::transaction_id_t>>
      address_transactions;
  std::unordered_map<explorer::schema::pool_id_t,
                     std::vector<explorer::schema::block_id_t>,
                     explorer::schema::hash32_hasher>
      pool_blocks;
  std::vector<explorer::schema::pool_id_t> stake_pools;
  std::vector<explorer::schema::vote_plan_id_t> vote_plans;
  std::unordered_set<explorer::schema::pool_id_t,
                     explorer::schema::hash32_hasher>
      known_pools;
  std::unordered_set<explorer::schema::vote_plan_id_t,
                     explorer::schema::hash32_hasher>
      known_vote_plans;
};

/// Shared-lock handle over the index state. Queries hold one for the
/// duration of a lookup or a page.
class read_view final {
 public:
  read_view(std::shared_mutex& mutex, const index_state& state)
      : lock_{mutex}, state_{&state} {}

  const index_state* operator->() const { return state_; }
  const index_state& operator*() const { return *state_; }

 private:
  std::shared_lock<std::shared_mutex> lock_;
  const index_state* state_;
};

/// Ingestion driver: persists, links and aggregates applied blocks.
///
/// A single ingestion mutex serializes writers. Content is written to the
/// entity store before the block is linked, so any reader that sees a block
/// in the DAG can load it and its ancestors. Aggregate updates of a block are
/// committed as one batch after linking. The index mutex is held exclusively
/// only while linking and updating in-memory sequences.
class indexer final {
 public:
  indexer(explorer::storage::entity_store& store, indexer_options options);

  indexer(const indexer&) = delete;
  indexer& operator=(const indexer&) = delete;

  /// Ingest one applied block from the ledger feed.
  ///
  /// Blocks whose parent is unknown are buffered and linked automatically
  /// once the parent arrives. Re-ingesting a stored block is a no-op.
  ingest_result ingest(const explorer::schema::applied_block_t& block);

  /// Rebuild the in-memory index from the ingestion log after a restart.
  /// Aggregates are re-applied only for entries whose aggregate batch never
  /// committed.
  void recover();

  /// Install the main branch change callback.
  void set_tip_listener(tip_listener_t listener);

  read_view view() const;

  explorer::storage::entity_store& store() { return store_; }
  const explorer::storage::entity_store& store() const { return store_; }
  std::size_t orphan_count() const;

  /// Branch view of a record against the current index state. Caller holds a
  /// read_view.
  static explorer::schema::branch_view make_branch_view(
      const index_state& state,
      const branch_record& branch);

 private:
  explorer::schema::ingest_status_t ingest_one(
      const explorer::schema::applied_block_t& block,
      std::string& log);
  explorer::schema::ingest_status_t link(
      const explorer::schema::block_t& block,
      const std::vector<explorer::schema::transaction_t>& transactions,
      uint64_t sequence,
      bool replay);
  void apply_transaction(explorer::storage::aggregate_batch& batch,
                         const explorer::schema::transaction_t& transaction);
  void apply_certificate(explorer::storage::aggregate_batch& batch,
                         const explorer::schema::transaction_t& transaction);
  void adjust_balance(explorer::storage::aggregate_batch& batch,
                      const explorer::schema::address_t& address,
                      explorer::schema::value_t value,
                      bool credit);
  void adjust_pool_stake(explorer::storage::aggregate_batch& batch,
                         const explorer::schema::pool_id_t& pool,
                         explorer::schema::value_t value,
                         bool credit);
  void delegate(explorer::storage::aggregate_batch& batch,
                const explorer::schema::address_t& address,
                const explorer::schema::pool_id_t& pool);
  void notify_tip(const explorer::schema::branch_view& tip);

  mutable std::mutex ingest_mutex_;
  mutable std::shared_mutex index_mutex_;
  std::mutex listener_mutex_;
  explorer::storage::entity_store& store_;
  indexer_options options_;
  index_state state_;
  orphan_pool orphans_;
  uint64_t next_sequence_{};
  tip_listener_t tip_listener_;
};

}  // namespace explorer::index
