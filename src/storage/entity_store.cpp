#include <explorer/schema/key/explorer_keys.hpp>
#include <explorer/storage/entity_store.hpp>

#include <spdlog/spdlog.h>

namespace explorer::storage {

using namespace explorer::schema;

entity_store::entity_store(std::string_view path,
                           const storage_options& options)
    : encoder_{}, storage_{make_storage<rocksdb_storage_tag>(path, options)} {}

void entity_store::put_applied(const block_t& block,
                               const std::vector<transaction_t>& txs,
                               const uint64_t sequence) {
  auto entries = std::vector<key_value_entry_t>{};
  entries.reserve(txs.size() + 2);
  for (const auto& tx : txs) {
    entries.emplace_back(key::make_transaction_key(encoder_, tx.id),
                         encoder_.encode(tx));
  }
  entries.emplace_back(key::make_block_key(encoder_, block.id),
                       encoder_.encode(block));
  entries.emplace_back(key::make_ingest_log_key(encoder_, sequence),
                       encoder_.encode(block.id));
  storage_.write_batch(entries);
}

void entity_store::commit_aggregates(const aggregate_batch& batch,
                                     const uint64_t sequence) {
  auto entries = std::vector<key_value_entry_t>{};
  entries.reserve(batch.pools_.size() + batch.plans_.size() +
                  batch.votes_.size() + batch.addresses_.size() + 1);
  for (const auto& [id, pool] : batch.pools_) {
    entries.emplace_back(key::make_stake_pool_key(encoder_, id),
                         encoder_.encode(pool));
  }
  for (const auto& [id, plan] : batch.plans_) {
    entries.emplace_back(key::make_vote_plan_key(encoder_, id),
                         encoder_.encode(plan));
  }
  for (const auto& [position, vote] : batch.votes_) {
    const auto& [plan, proposal_index, vote_index] = position;
    entries.emplace_back(
        key::make_vote_key(encoder_, plan, proposal_index, vote_index),
        encoder_.encode(vote));
  }
  for (const auto& [address, state] : batch.addresses_) {
    entries.emplace_back(key::make_address_key(encoder_, address),
                         encoder_.encode(state));
  }
  entries.emplace_back(key::make_applied_marker_key(encoder_, sequence),
                       encoder_.encode(sequence));
  storage_.write_batch(entries);
}

bool entity_store::aggregates_applied(const uint64_t sequence) const {
  return storage_
      .get<uint64_t>(encoder_, key::make_applied_marker_key(encoder_, sequence))
      .has_value();
}

std::optional<block_t> entity_store::get_block(const block_id_t& id) const {
  return storage_.get<block_t>(encoder_, key::make_block_key(encoder_, id));
}

std::optional<transaction_t> entity_store::get_transaction(
    const transaction_id_t& id) const {
  return storage_.get<transaction_t>(encoder_,
                                     key::make_transaction_key(encoder_, id));
}

std::optional<stake_pool_state_t> entity_store::get_stake_pool(
    const pool_id_t& id) const {
  return storage_.get<stake_pool_state_t>(
      encoder_, key::make_stake_pool_key(encoder_, id));
}

std::optional<vote_plan_state_t> entity_store::get_vote_plan(
    const vote_plan_id_t& id) const {
  return storage_.get<vote_plan_state_t>(
      encoder_, key::make_vote_plan_key(encoder_, id));
}

std::optional<vote_record> entity_store::get_vote(
    const vote_plan_id_t& plan,
    const uint8_t proposal_index,
    const uint64_t vote_index) const {
  return storage_.get<vote_record>(
      encoder_,
      key::make_vote_key(encoder_, plan, proposal_index, vote_index));
}

std::optional<address_state_t> entity_store::get_address(
    const address_t& address) const {
  return storage_.get<address_state_t>(
      encoder_, key::make_address_key(encoder_, address));
}

std::vector<ingest_log_entry_t> entity_store::list_ingested() const {
  auto entries = std::vector<ingest_log_entry_t>{};
  auto prefix = key::make_prefix_key(encoder_, key::kIngestLogPrefix);
  storage_.scan_prefix(prefix, [&](const bytes_view_t& raw_key,
                                   const bytes_view_t& raw_value) {
    auto sequence = key::parse_ingest_log_key(encoder_, raw_key);
    auto id = encoder_.try_decode<block_id_t>(raw_value);
    if (!sequence.has_value() || !id.has_value()) {
      spdlog::warn("Skipping malformed ingestion log entry {}",
                   to_hex(raw_key));
      return true;
    }
    entries.emplace_back(*sequence, *id);
    return true;
  });
  return entries;
}

std::optional<stake_pool_state_t> aggregate_batch::get_stake_pool(
    const pool_id_t& id) const {
  if (auto it = pools_.find(id); it != std::end(pools_)) {
    return it->second;
  }
  return store_.get_stake_pool(id);
}

void aggregate_batch::put_stake_pool(const stake_pool_state_t& pool) {
  pools_.insert_or_assign(pool.id, pool);
}

std::optional<vote_plan_state_t> aggregate_batch::get_vote_plan(
    const vote_plan_id_t& id) const {
  if (auto it = plans_.find(id); it != std::end(plans_)) {
    return it->second;
  }
  return store_.get_vote_plan(id);
}

void aggregate_batch::put_vote_plan(const vote_plan_state_t& plan) {
  plans_.insert_or_assign(plan.id, plan);
}

void aggregate_batch::put_vote(const vote_plan_id_t& plan,
                               const uint8_t proposal_index,
                               const uint64_t vote_index,
                               const vote_record& vote) {
  votes_.insert_or_assign(vote_key_t{plan, proposal_index, vote_index}, vote);
}

std::optional<address_state_t> aggregate_batch::get_address(
    const address_t& address) const {
  if (auto it = addresses_.find(address); it != std::end(addresses_)) {
    return it->second;
  }
  return store_.get_address(address);
}

void aggregate_batch::put_address(const address_state_t& address) {
  addresses_.insert_or_assign(address.address, address);
}

}  // namespace explorer::storage
