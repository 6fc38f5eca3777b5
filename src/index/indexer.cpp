#include <explorer/common/critical.hpp>
#include <explorer/index/indexer.hpp>
#include <explorer/schema/bech32.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <iterator>
#include <utility>

namespace explorer::index {

using namespace explorer::schema;
using explorer::storage::aggregate_batch;

namespace {

/// Valid addresses are keyed by their lowercase spelling.
address_t canonical_address(const address_t& address) {
  return normalize_address(address).value_or(address);
}

std::vector<address_t> touched_addresses(const transaction_t& transaction) {
  auto out = std::vector<address_t>{};
  auto add = [&](const address_t& raw) {
    auto address = canonical_address(raw);
    if (std::find(std::begin(out), std::end(out), address) == std::end(out)) {
      out.push_back(std::move(address));
    }
  };
  for (const auto& input : transaction.inputs) {
    add(input.address);
  }
  for (const auto& output : transaction.outputs) {
    add(output.address);
  }
  return out;
}

template <typename Certificate>
const Certificate* certificate_as(const transaction_t& transaction) {
  if (!transaction.certificate.has_value()) {
    return nullptr;
  }
  return std::get_if<Certificate>(&*transaction.certificate);
}

}  // namespace

index_state::index_state(uint32_t epoch_stability_depth,
                         uint32_t retention_window,
                         ledger_order_t order)
    : dag{},
      tracker{dag, epoch_stability_depth, retention_window, std::move(order)} {}

indexer::indexer(explorer::storage::entity_store& store,
                 indexer_options options)
    : store_{store},
      options_{std::move(options)},
      state_{options_.epoch_stability_depth,
             options_.retention_window.value_or(options_.epoch_stability_depth),
             options_.ledger_order},
      orphans_{options_.max_orphans} {}

void indexer::set_tip_listener(tip_listener_t listener) {
  auto lock = std::scoped_lock{listener_mutex_};
  tip_listener_ = std::move(listener);
}

read_view indexer::view() const {
  return read_view{index_mutex_, state_};
}

std::size_t indexer::orphan_count() const {
  auto lock = std::scoped_lock{ingest_mutex_};
  return orphans_.size();
}

branch_view indexer::make_branch_view(const index_state& state,
                                      const branch_record& branch) {
  const auto& tip = state.dag.node(branch.tip);
  auto main = state.tracker.main();
  return branch_view{.id = branch.id,
                     .tip = tip.id,
                     .chain_length = tip.chain_length,
                     .date = tip.date,
                     .is_main = main.has_value() && main->id == branch.id,
                     .is_live = branch.live};
}

ingest_result indexer::ingest(const applied_block_t& block) {
  auto lock = std::scoped_lock{ingest_mutex_};
  auto result = ingest_result{};

  try {
    result.status = ingest_one(block, result.log);
    if (result.status != ingest_status_t::linked &&
        result.status != ingest_status_t::excluded) {
      return result;
    }
    result.linked.push_back(block.id);

    // Buffered descendants are linked breadth first as their parents land.
    auto pending = std::deque<block_id_t>{block.id};
    while (!pending.empty()) {
      auto parent = pending.front();
      pending.pop_front();
      for (const auto& child : orphans_.take_children(parent)) {
        auto child_log = std::string{};
        auto status = ingest_one(child, child_log);
        if (status == ingest_status_t::linked ||
            status == ingest_status_t::excluded) {
          result.linked.push_back(child.id);
          pending.push_back(child.id);
        }
      }
    }
  } catch (const explorer::common::internal_consistency_error& ex) {
    spdlog::critical("Rejecting block {}: {}", to_hex(block.id), ex.what());
    result.status = ingest_status_t::rejected;
    result.log = ex.what();
  }
  return result;
}

ingest_status_t indexer::ingest_one(const applied_block_t& block,
                                    std::string& log) {
  // Only this thread mutates state_, so reads here need no index lock.
  if (auto existing = state_.dag.find(block.id)) {
    auto candidate =
        make_block(block, state_.dag.node(*existing).chain_length);
    auto stored = store_.get_block(block.id);
    if (stored.has_value() && *stored == candidate) {
      spdlog::debug("Block {} already indexed", to_hex(block.id));
      return ingest_status_t::duplicate;
    }
    log = "block id already indexed with different content";
    spdlog::warn("Conflicting content for block {}", to_hex(block.id));
    return ingest_status_t::conflict;
  }
  if (orphans_.contains(block.id)) {
    log = "block already buffered";
    return ingest_status_t::orphan;
  }

  auto chain_length = chain_length_t{};
  if (block.parent_id.has_value()) {
    auto parent = state_.dag.find(*block.parent_id);
    if (!parent.has_value()) {
      orphans_.add(block);
      log = "parent " + to_hex(*block.parent_id) + " not indexed";
      return ingest_status_t::orphan;
    }
    chain_length = state_.dag.node(*parent).chain_length + 1;
  } else if (state_.dag.genesis().has_value()) {
    log = "genesis already indexed";
    spdlog::warn("Rejecting second genesis block {}", to_hex(block.id));
    return ingest_status_t::conflict;
  }

  for (const auto& transaction : block.transactions) {
    if (!state_.transaction_blocks.contains(transaction.id)) {
      continue;
    }
    auto stored = store_.get_transaction(transaction.id);
    if (stored.has_value() && *stored != transaction) {
      log = "transaction " + to_hex(transaction.id) +
            " already indexed with different content";
      spdlog::warn("Block {} carries conflicting transaction {}",
                   to_hex(block.id), to_hex(transaction.id));
      return ingest_status_t::conflict;
    }
  }

  auto record = make_block(block, chain_length);
  auto sequence = next_sequence_++;
  store_.put_applied(record, block.transactions, sequence);
  return link(record, block.transactions, sequence, false);
}

ingest_status_t indexer::link(const block_t& block,
                              const std::vector<transaction_t>& transactions,
                              const uint64_t sequence,
                              const bool replay) {
  auto first_seen = std::vector<const transaction_t*>{};
  auto tip = std::optional<branch_view>{};

  {
    auto lock = std::unique_lock{index_mutex_};
    auto main_before = state_.tracker.main();
    auto linked = state_.dag.ingest(block);
    if (linked.status != link_status::linked) {
      spdlog::warn("Block {} could not be linked at chain length {}",
                   to_hex(block.id), block.chain_length);
      return ingest_status_t::conflict;
    }

    auto update = state_.tracker.on_linked(linked.slot);
    if (update.excluded) {
      state_.dag.exclude_subtree(linked.slot);
      spdlog::warn("Block {} excluded from branches", to_hex(block.id));
      return ingest_status_t::excluded;
    }

    for (const auto& transaction : transactions) {
      auto& blocks = state_.transaction_blocks[transaction.id];
      if (blocks.empty()) {
        first_seen.push_back(&transaction);
        for (const auto& address : touched_addresses(transaction)) {
          state_.address_transactions[address].push_back(transaction.id);
        }
      }
      blocks.push_back(block.id);
    }
    if (block.leader.has_value()) {
      if (const auto* leader = std::get_if<pool_leader>(&*block.leader)) {
        state_.pool_blocks[leader->pool_id].push_back(block.id);
      }
    }

    auto main_after = state_.tracker.main();
    if (main_after.has_value() &&
        (!main_before.has_value() || main_before->id != main_after->id ||
         main_before->tip != main_after->tip)) {
      tip = make_branch_view(state_, *main_after);
    }
  }
  spdlog::debug("Linked block {} at chain length {}", to_hex(block.id),
                block.chain_length);

  // Aggregates land in one batch with the entry's marker. Replay redoes the
  // entries whose batch never committed.
  if (!replay || !store_.aggregates_applied(sequence)) {
    if (replay) {
      spdlog::info("Applying aggregates of ingestion log entry {} (block {})",
                   sequence, to_hex(block.id));
    }
    auto batch = aggregate_batch{store_};
    for (const auto* transaction : first_seen) {
      apply_transaction(batch, *transaction);
    }
    store_.commit_aggregates(batch, sequence);
  }

  // Listed only once the aggregate record exists.
  {
    auto lock = std::unique_lock{index_mutex_};
    for (const auto* transaction : first_seen) {
      if (const auto* registration =
              certificate_as<pool_registration>(*transaction)) {
        if (state_.known_pools.insert(registration->pool_id).second) {
          state_.stake_pools.push_back(registration->pool_id);
        }
      } else if (const auto* plan =
                     certificate_as<vote_plan_certificate>(*transaction)) {
        if (state_.known_vote_plans.insert(plan->vote_plan_id).second) {
          state_.vote_plans.push_back(plan->vote_plan_id);
        }
      }
    }
  }

  if (tip.has_value() && !replay) {
    notify_tip(*tip);
  }
  return ingest_status_t::linked;
}

void indexer::recover() {
  auto lock = std::scoped_lock{ingest_mutex_};
  auto entries = store_.list_ingested();
  spdlog::info("Replaying {} ingested block(s)", entries.size());

  for (const auto& [sequence, id] : entries) {
    next_sequence_ = std::max(next_sequence_, sequence + 1);
    auto block = store_.get_block(id);
    if (!block.has_value()) {
      spdlog::critical("Ingestion log entry {} names missing block {}",
                       sequence, to_hex(id));
      continue;
    }
    auto transactions = std::vector<transaction_t>{};
    transactions.reserve(block->transactions.size());
    for (const auto& transaction_id : block->transactions) {
      auto transaction = store_.get_transaction(transaction_id);
      if (!transaction.has_value()) {
        explorer::common::critical("transaction " + to_hex(transaction_id) +
                                   " of block " + to_hex(id) + " is missing");
      }
      transactions.push_back(std::move(*transaction));
    }
    try {
      link(*block, transactions, sequence, true);
    } catch (const explorer::common::internal_consistency_error& ex) {
      spdlog::critical("Replaying block {} failed: {}", to_hex(id), ex.what());
    }
  }

  auto tip = std::optional<branch_view>{};
  {
    auto view = read_view{index_mutex_, state_};
    if (auto main = view->tracker.main()) {
      tip = make_branch_view(*view, *main);
      spdlog::info("Recovered main branch {} at chain length {}", tip->id,
                   tip->chain_length);
    }
  }
  if (tip.has_value()) {
    notify_tip(*tip);
  }
}

void indexer::notify_tip(const branch_view& tip) {
  auto lock = std::scoped_lock{listener_mutex_};
  if (tip_listener_) {
    tip_listener_(tip);
  }
}

void indexer::apply_transaction(aggregate_batch& batch,
                                const transaction_t& transaction) {
  for (const auto& input : transaction.inputs) {
    adjust_balance(batch, input.address, input.value, false);
  }
  for (const auto& output : transaction.outputs) {
    adjust_balance(batch, output.address, output.value, true);
  }
  if (transaction.certificate.has_value()) {
    apply_certificate(batch, transaction);
  }
}

void indexer::adjust_balance(aggregate_batch& batch,
                             const address_t& raw_address,
                             const value_t value,
                             const bool credit) {
  auto address = canonical_address(raw_address);
  auto state =
      batch.get_address(address).value_or(address_state_t{.address = address});
  auto applied = value;
  if (credit) {
    state.balance += value;
  } else {
    if (value > state.balance) {
      spdlog::warn("Address {} spends {} with balance {}", address, value,
                   state.balance);
      applied = state.balance;
    }
    state.balance -= applied;
  }
  batch.put_address(state);
  if (state.delegation.has_value()) {
    adjust_pool_stake(batch, *state.delegation, applied, credit);
  }
}

void indexer::adjust_pool_stake(aggregate_batch& batch,
                                const pool_id_t& pool,
                                const value_t value,
                                const bool credit) {
  auto state = batch.get_stake_pool(pool);
  if (!state.has_value()) {
    spdlog::debug("Stake moved for unregistered pool {}", to_hex(pool));
    return;
  }
  if (credit) {
    state->delegated_stake += value;
  } else {
    state->delegated_stake -= std::min(value, state->delegated_stake);
  }
  batch.put_stake_pool(*state);
}

void indexer::delegate(aggregate_batch& batch,
                       const address_t& raw_address,
                       const pool_id_t& pool) {
  auto address = canonical_address(raw_address);
  auto state =
      batch.get_address(address).value_or(address_state_t{.address = address});
  if (state.delegation == pool) {
    return;
  }
  if (state.delegation.has_value()) {
    adjust_pool_stake(batch, *state.delegation, state.balance, false);
  }
  state.delegation = pool;
  batch.put_address(state);
  adjust_pool_stake(batch, pool, state.balance, true);
}

void indexer::apply_certificate(aggregate_batch& batch,
                                const transaction_t& transaction) {
  const auto voter = transaction.inputs.empty()
                         ? std::optional<address_t>{}
                         : std::optional<address_t>{canonical_address(
                               transaction.inputs.front().address)};

  std::visit(
      overloaded{
          [&](const stake_delegation& certificate) {
            delegate(batch, certificate.account, certificate.pool_id);
          },
          [&](const owner_stake_delegation& certificate) {
            if (!voter.has_value()) {
              spdlog::warn("Owner delegation in transaction {} has no input",
                           to_hex(transaction.id));
              return;
            }
            delegate(batch, *voter, certificate.pool_id);
          },
          [&](const pool_registration& certificate) {
            if (batch.get_stake_pool(certificate.pool_id).has_value()) {
              spdlog::warn("Pool {} registered again in transaction {}",
                           to_hex(certificate.pool_id), to_hex(transaction.id));
              return;
            }
            batch.put_stake_pool(
                stake_pool_state_t{.id = certificate.pool_id,
                                   .registration = certificate,
                                   .retirement = std::nullopt,
                                   .delegated_stake = 0});
          },
          [&](const pool_retirement& certificate) {
            auto pool = batch.get_stake_pool(certificate.pool_id);
            if (!pool.has_value()) {
              spdlog::warn("Retirement of unknown pool {}",
                           to_hex(certificate.pool_id));
              return;
            }
            pool->retirement = certificate;
            batch.put_stake_pool(*pool);
          },
          [&](const pool_update& certificate) {
            auto pool = batch.get_stake_pool(certificate.pool_id);
            if (!pool.has_value()) {
              spdlog::warn("Update of unknown pool {}",
                           to_hex(certificate.pool_id));
              return;
            }
            pool->registration = certificate.registration;
            pool->registration.pool_id = certificate.pool_id;
            batch.put_stake_pool(*pool);
          },
          [&](const vote_plan_certificate& certificate) {
            if (batch.get_vote_plan(certificate.vote_plan_id).has_value()) {
              spdlog::warn("Vote plan {} created again",
                           to_hex(certificate.vote_plan_id));
              return;
            }
            auto plan = vote_plan_state_t{
                .id = certificate.vote_plan_id,
                .vote_start = certificate.vote_start,
                .vote_end = certificate.vote_end,
                .committee_end = certificate.committee_end,
                .payload_type = certificate.payload_type};
            for (const auto& proposal : certificate.proposals) {
              plan.proposals.push_back(
                  proposal_state{.external_id = proposal.external_id,
                                 .options = proposal.options,
                                 .tally_results = std::nullopt,
                                 .votes_count = 0});
            }
            batch.put_vote_plan(plan);
          },
          [&](const vote_cast& certificate) {
            auto plan = batch.get_vote_plan(certificate.vote_plan_id);
            if (!plan.has_value() ||
                certificate.proposal_index >= plan->proposals.size()) {
              spdlog::warn("Vote for unknown proposal {} of plan {}",
                           certificate.proposal_index,
                           to_hex(certificate.vote_plan_id));
              return;
            }
            if (!voter.has_value()) {
              spdlog::warn("Vote in transaction {} has no input",
                           to_hex(transaction.id));
              return;
            }
            auto payload_type =
                std::holds_alternative<private_vote_payload>(
                    certificate.payload)
                    ? payload_type_t::private_payload
                    : payload_type_t::public_payload;
            if (payload_type != plan->payload_type) {
              spdlog::warn(
                  "Dropping {} vote in transaction {} for {} vote plan {}",
                  to_string(payload_type), to_hex(transaction.id),
                  to_string(plan->payload_type),
                  to_hex(certificate.vote_plan_id));
              return;
            }
            auto& proposal = plan->proposals[certificate.proposal_index];
            batch.put_vote(certificate.vote_plan_id,
                           certificate.proposal_index, proposal.votes_count,
                           vote_record{.address = *voter,
                                       .payload = certificate.payload});
            ++proposal.votes_count;
            batch.put_vote_plan(*plan);
          },
          [&](const vote_tally& certificate) {
            auto plan = batch.get_vote_plan(certificate.vote_plan_id);
            if (!plan.has_value()) {
              spdlog::warn("Tally for unknown vote plan {}",
                           to_hex(certificate.vote_plan_id));
              return;
            }
            auto count =
                std::min(certificate.results.size(), plan->proposals.size());
            for (auto i = std::size_t{0}; i < count; ++i) {
              auto& proposal = plan->proposals[i];
              if (certificate.results[i].size() != proposal.options) {
                spdlog::warn(
                    "Tally of plan {} proposal {} has {} results for {} "
                    "options",
                    to_hex(certificate.vote_plan_id), i,
                    certificate.results[i].size(), proposal.options);
                continue;
              }
              proposal.tally_results = certificate.results[i];
            }
            batch.put_vote_plan(*plan);
          },
          [&](const encrypted_vote_tally& certificate) {
            auto plan = batch.get_vote_plan(certificate.vote_plan_id);
            if (!plan.has_value()) {
              spdlog::warn("Encrypted tally for unknown vote plan {}",
                           to_hex(certificate.vote_plan_id));
              return;
            }
            plan->encrypted_tally_started = true;
            batch.put_vote_plan(*plan);
          }},
      *transaction.certificate);
}

}  // namespace explorer::index
