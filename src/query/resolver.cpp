#include <explorer/common/critical.hpp>
#include <explorer/query/resolver.hpp>
#include <explorer/schema/bech32.hpp>
#include <explorer/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <string>
#include <tuple>
#include <utility>

namespace explorer::query {

using namespace explorer::schema;
using explorer::common::internal_consistency_error;
using explorer::index::index_state;
using explorer::index::kNoSlot;

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

constexpr auto kCodespace = std::string_view{"explorer"};

template <typename T, typename Body>
resolution<T> guarded(Body&& body) {
  try {
    return body();
  } catch (const internal_consistency_error& ex) {
    spdlog::error("Query hit an inconsistent record: {}", ex.what());
    return failed<T>(query_error_code::internal_consistency, ex.what());
  }
}

bytes_t encode_scope(const auto& scope) {
  auto encoder = encoder_t{};
  return encoder.encode(scope);
}

sequence_bounds bounds_of_size(const uint64_t size) {
  if (size == 0) {
    return sequence_bounds{.lower = 0, .upper = std::nullopt};
  }
  return sequence_bounds{.lower = 0, .upper = size - 1};
}

block_t load_block(const explorer::storage::entity_store& store,
                   const block_id_t& id) {
  auto block = store.get_block(id);
  if (!block.has_value()) {
    throw internal_consistency_error{"indexed block " + to_hex(id) +
                                     " is missing from the store"};
  }
  return std::move(*block);
}

block_view make_block_view(const index_state& state,
                           const std::optional<explorer::index::slot_t> slot,
                           block_t block) {
  auto view = block_view{.block = std::move(block)};
  if (slot.has_value() && !state.dag.node(*slot).excluded) {
    view.is_confirmed = state.tracker.is_confirmed(*slot);
    view.branches = state.tracker.branches_containing(*slot);
  }
  return view;
}

block_view load_block_view(const index_state& state,
                           const explorer::storage::entity_store& store,
                           const explorer::index::slot_t slot) {
  return make_block_view(state, slot,
                         load_block(store, state.dag.node(slot).id));
}

transaction_view make_transaction_view(const index_state& state,
                                       transaction_t transaction) {
  auto view = transaction_view{.transaction = std::move(transaction)};
  if (auto it = state.transaction_blocks.find(view.transaction.id);
      it != std::end(state.transaction_blocks)) {
    view.blocks = it->second;
  }
  return view;
}

stake_pool_view make_stake_pool_view(const index_state& state,
                                     stake_pool_state_t pool) {
  auto view = stake_pool_view{.id = pool.id,
                              .registration = std::move(pool.registration),
                              .retirement = std::move(pool.retirement),
                              .delegated_stake = pool.delegated_stake};
  if (auto it = state.pool_blocks.find(view.id);
      it != std::end(state.pool_blocks)) {
    view.total_blocks = it->second.size();
  }
  return view;
}

std::optional<explorer::index::branch_record> find_branch(
    const index_state& state,
    const std::optional<branch_id_t> id) {
  return id.has_value() ? state.tracker.find(*id) : state.tracker.main();
}

/// Chain lengths [first, last] of the blocks in `epoch` on the chain ending
/// at `tip`. Block dates never decrease along a chain.
std::optional<std::pair<chain_length_t, chain_length_t>> epoch_range(
    const index_state& state,
    const explorer::index::slot_t tip,
    const epoch_t epoch) {
  const auto tip_length = uint64_t{state.dag.node(tip).chain_length};
  auto epoch_at = [&](const uint64_t length) {
    return state.dag
        .node(state.dag.ancestor_at(tip, static_cast<chain_length_t>(length)))
        .date.epoch;
  };

  auto lo = uint64_t{0};
  auto hi = tip_length + 1;
  while (lo < hi) {
    auto mid = lo + (hi - lo) / 2;
    if (epoch_at(mid) < epoch) {
      lo = mid + 1;
    } else {
      hi = mid;
    }
  }
  if (lo > tip_length || epoch_at(lo) != epoch) {
    return std::nullopt;
  }
  const auto first = lo;

  hi = tip_length + 1;
  while (lo < hi) {
    auto mid = lo + (hi - lo) / 2;
    if (epoch_at(mid) <= epoch) {
      lo = mid + 1;
    } else {
      hi = mid;
    }
  }
  return std::pair{static_cast<chain_length_t>(first),
                   static_cast<chain_length_t>(lo - 1)};
}

template <typename Request>
std::optional<Request> decode_request(const bytes_view_t& data) {
  auto encoder = encoder_t{};
  return encoder.try_decode<Request>(data);
}

template <typename T>
void fill(query_result_t& out, const resolution<T>& result) {
  out.code = result.code;
  out.log = result.log;
  if (result.value.has_value()) {
    auto encoder = encoder_t{};
    out.value = encoder.encode(*result.value);
  }
}

template <typename Request, typename Handler>
void dispatch(query_result_t& out,
              const bytes_view_t& data,
              Handler&& handler) {
  auto request = decode_request<Request>(data);
  if (!request.has_value()) {
    out.code = query_error_code::invalid_argument;
    out.log = "malformed request data";
    return;
  }
  fill(out, std::apply(std::forward<Handler>(handler), std::move(*request)));
}

}  // namespace

std::optional<tally_status_t> make_tally_status(
    const payload_type_t payload_type,
    const proposal_state& proposal) {
  auto options = option_range{.start = 0, .end = proposal.options};
  switch (payload_type) {
    case payload_type_t::public_payload:
      if (!proposal.tally_results.has_value()) {
        return std::nullopt;
      }
      return tally_status_t{tally_public_status{
          .results = *proposal.tally_results, .options = options}};
    case payload_type_t::private_payload:
      return tally_status_t{tally_private_status{
          .results = proposal.tally_results, .options = options}};
  }
  throw internal_consistency_error{"unknown vote plan payload type"};
}

vote_plan_view make_vote_plan_view(const vote_plan_state_t& plan) {
  auto view = vote_plan_view{.id = plan.id,
                             .vote_start = plan.vote_start,
                             .vote_end = plan.vote_end,
                             .committee_end = plan.committee_end,
                             .payload_type = plan.payload_type};
  view.proposals.reserve(plan.proposals.size());
  for (auto i = std::size_t{0}; i < plan.proposals.size(); ++i) {
    const auto& proposal = plan.proposals[i];
    view.proposals.push_back(
        proposal_view{.external_id = proposal.external_id,
                      .index = static_cast<uint8_t>(i),
                      .options = option_range{.start = 0, .end = proposal.options},
                      .tally = make_tally_status(plan.payload_type, proposal),
                      .votes_count = proposal.votes_count});
  }
  return view;
}

resolver::resolver(const explorer::index::indexer& indexer,
                   settings_t settings,
                   const uint64_t max_page_size)
    : indexer_{indexer},
      settings_{std::move(settings)},
      max_page_size_{max_page_size} {}

resolution<block_view> resolver::block(const block_id_t& id) const {
  return guarded<block_view>([&] {
    auto view = indexer_.view();
    auto stored = indexer_.store().get_block(id);
    if (!stored.has_value()) {
      return failed<block_view>(query_error_code::not_found,
                                "block " + to_hex(id) + " not found");
    }
    return resolved(make_block_view(*view, view->dag.find(id),
                                    std::move(*stored)));
  });
}

resolution<std::vector<block_view>> resolver::blocks_by_chain_length(
    const chain_length_t length) const {
  return guarded<std::vector<block_view>>([&] {
    auto view = indexer_.view();
    auto out = std::vector<block_view>{};
    for (const auto slot : view->dag.blocks_at_chain_length(length)) {
      if (!view->dag.node(slot).excluded) {
        out.push_back(load_block_view(*view, indexer_.store(), slot));
      }
    }
    return resolved(std::move(out));
  });
}

resolution<transaction_view> resolver::transaction(
    const transaction_id_t& id) const {
  return guarded<transaction_view>([&] {
    auto view = indexer_.view();
    auto stored = indexer_.store().get_transaction(id);
    if (!stored.has_value()) {
      return failed<transaction_view>(
          query_error_code::not_found, "transaction " + to_hex(id) + " not found");
    }
    return resolved(make_transaction_view(*view, std::move(*stored)));
  });
}

resolution<std::vector<branch_view>> resolver::branches() const {
  auto view = indexer_.view();
  auto out = std::vector<branch_view>{};
  for (const auto& branch : view->tracker.live_branches()) {
    out.push_back(explorer::index::indexer::make_branch_view(*view, branch));
  }
  return resolved(std::move(out));
}

resolution<branch_view> resolver::tip() const {
  auto view = indexer_.view();
  auto main = view->tracker.main();
  if (!main.has_value()) {
    return failed<branch_view>(query_error_code::not_found,
                               "no block has been indexed");
  }
  return resolved(explorer::index::indexer::make_branch_view(*view, *main));
}

resolution<branch_view> resolver::branch(const branch_id_t id) const {
  auto view = indexer_.view();
  auto found = view->tracker.find(id);
  if (!found.has_value()) {
    return failed<branch_view>(query_error_code::not_found,
                               "branch " + std::to_string(id) + " not found");
  }
  return resolved(explorer::index::indexer::make_branch_view(*view, *found));
}

resolution<epoch_view> resolver::epoch(
    const epoch_t id,
    const std::optional<branch_id_t> branch) const {
  auto view = indexer_.view();
  auto record = find_branch(*view, branch);
  if (!record.has_value()) {
    return failed<epoch_view>(query_error_code::not_found, "branch not found");
  }
  auto range = epoch_range(*view, record->tip, id);
  if (!range.has_value()) {
    return failed<epoch_view>(
        query_error_code::not_found,
        "epoch " + std::to_string(id) + " has no block on this branch");
  }
  const auto& dag = view->dag;
  return resolved(epoch_view{
      .id = id,
      .branch = record->id,
      .first_block = dag.node(dag.ancestor_at(record->tip, range->first)).id,
      .last_block = dag.node(dag.ancestor_at(record->tip, range->second)).id,
      .total_blocks = uint64_t{range->second} - range->first + 1});
}

resolution<address_view> resolver::address(const std::string_view bech32) const {
  auto normalized = normalize_address(bech32);
  if (!normalized.has_value()) {
    return failed<address_view>(query_error_code::invalid_argument,
                                "invalid bech32 address");
  }
  return guarded<address_view>([&] {
    auto view = indexer_.view();
    const auto& id = *normalized;
    auto state = indexer_.store().get_address(id);
    auto history = view->address_transactions.find(id);
    if (!state.has_value() && history == std::end(view->address_transactions)) {
      return failed<address_view>(query_error_code::not_found,
                                  "address " + id + " not found");
    }
    auto out = address_view{.id = id};
    if (state.has_value()) {
      out.delegation = state->delegation;
      out.balance = state->balance;
    }
    if (history != std::end(view->address_transactions)) {
      out.total_transactions = history->second.size();
    }
    return resolved(std::move(out));
  });
}

resolution<stake_pool_view> resolver::stake_pool(const pool_id_t& id) const {
  return guarded<stake_pool_view>([&] {
    auto view = indexer_.view();
    auto pool = indexer_.store().get_stake_pool(id);
    if (!pool.has_value()) {
      return failed<stake_pool_view>(query_error_code::not_found,
                                     "stake pool " + to_hex(id) + " not found");
    }
    return resolved(make_stake_pool_view(*view, std::move(*pool)));
  });
}

resolution<settings_t> resolver::settings() const {
  auto out = settings_;
  out.epoch_stability_depth = indexer_.view()->tracker.epoch_stability_depth();
  return resolved(std::move(out));
}

resolution<vote_plan_view> resolver::vote_plan(const vote_plan_id_t& id) const {
  return guarded<vote_plan_view>([&] {
    auto plan = indexer_.store().get_vote_plan(id);
    if (!plan.has_value()) {
      return failed<vote_plan_view>(query_error_code::not_found,
                                    "vote plan " + to_hex(id) + " not found");
    }
    return resolved(make_vote_plan_view(*plan));
  });
}

resolution<connection<block_view>> resolver::branch_blocks(
    const branch_id_t branch,
    const pagination_arguments& arguments,
    const std::stop_token& stop) const {
  auto view = indexer_.view();
  auto record = view->tracker.find(branch);
  if (!record.has_value()) {
    return failed<connection<block_view>>(
        query_error_code::not_found, "branch " + std::to_string(branch) + " not found");
  }
  auto key = sequence_key{.kind = sequence_kind::branch_blocks,
                          .scope = encode_scope(branch)};
  auto bounds = sequence_bounds{
      .lower = 0, .upper = uint64_t{view->dag.node(record->tip).chain_length}};
  return paginate<block_view>(
      key, bounds, arguments, max_page_size_,
      [&](const uint64_t position) -> std::optional<block_view> {
        auto slot = view->dag.ancestor_at(
            record->tip, static_cast<chain_length_t>(position));
        if (slot == kNoSlot) {
          return std::nullopt;
        }
        return load_block_view(*view, indexer_.store(), slot);
      },
      stop);
}

resolution<connection<stake_pool_view>> resolver::branch_stake_pools(
    const branch_id_t branch,
    const pagination_arguments& arguments,
    const std::stop_token& stop) const {
  auto view = indexer_.view();
  if (!view->tracker.find(branch).has_value()) {
    return failed<connection<stake_pool_view>>(
        query_error_code::not_found, "branch " + std::to_string(branch) + " not found");
  }
  auto key = sequence_key{.kind = sequence_kind::stake_pools,
                          .scope = encode_scope(branch)};
  return paginate<stake_pool_view>(
      key, bounds_of_size(view->stake_pools.size()), arguments, max_page_size_,
      [&](const uint64_t position) -> std::optional<stake_pool_view> {
        auto pool = indexer_.store().get_stake_pool(view->stake_pools[position]);
        if (!pool.has_value()) {
          return std::nullopt;
        }
        return make_stake_pool_view(*view, std::move(*pool));
      },
      stop);
}

resolution<connection<vote_plan_view>> resolver::branch_vote_plans(
    const branch_id_t branch,
    const pagination_arguments& arguments,
    const std::stop_token& stop) const {
  auto view = indexer_.view();
  if (!view->tracker.find(branch).has_value()) {
    return failed<connection<vote_plan_view>>(
        query_error_code::not_found, "branch " + std::to_string(branch) + " not found");
  }
  auto key = sequence_key{.kind = sequence_kind::vote_plans,
                          .scope = encode_scope(branch)};
  return paginate<vote_plan_view>(
      key, bounds_of_size(view->vote_plans.size()), arguments, max_page_size_,
      [&](const uint64_t position) -> std::optional<vote_plan_view> {
        auto plan = indexer_.store().get_vote_plan(view->vote_plans[position]);
        if (!plan.has_value()) {
          return std::nullopt;
        }
        return make_vote_plan_view(*plan);
      },
      stop);
}

resolution<connection<block_view>> resolver::epoch_blocks(
    const epoch_t epoch,
    const std::optional<branch_id_t> branch,
    const pagination_arguments& arguments,
    const std::stop_token& stop) const {
  auto view = indexer_.view();
  auto record = find_branch(*view, branch);
  if (!record.has_value()) {
    return failed<connection<block_view>>(query_error_code::not_found,
                                          "branch not found");
  }
  auto key = sequence_key{.kind = sequence_kind::epoch_blocks,
                          .scope = encode_scope(std::tuple{record->id, epoch})};
  auto bounds = sequence_bounds{.lower = 0, .upper = std::nullopt};
  if (auto range = epoch_range(*view, record->tip, epoch)) {
    bounds = sequence_bounds{.lower = range->first, .upper = range->second};
  }
  return paginate<block_view>(
      key, bounds, arguments, max_page_size_,
      [&](const uint64_t position) -> std::optional<block_view> {
        auto slot = view->dag.ancestor_at(
            record->tip, static_cast<chain_length_t>(position));
        if (slot == kNoSlot) {
          return std::nullopt;
        }
        return load_block_view(*view, indexer_.store(), slot);
      },
      stop);
}

resolution<connection<transaction_view>> resolver::block_transactions(
    const block_id_t& id,
    const pagination_arguments& arguments,
    const std::stop_token& stop) const {
  return guarded<connection<transaction_view>>([&] {
    auto view = indexer_.view();
    auto stored = indexer_.store().get_block(id);
    if (!stored.has_value()) {
      return failed<connection<transaction_view>>(
          query_error_code::not_found, "block " + to_hex(id) + " not found");
    }
    auto key = sequence_key{.kind = sequence_kind::block_transactions,
                            .scope = encode_scope(id)};
    return paginate<transaction_view>(
        key, bounds_of_size(stored->transactions.size()), arguments,
        max_page_size_,
        [&](const uint64_t position) -> std::optional<transaction_view> {
          auto transaction =
              indexer_.store().get_transaction(stored->transactions[position]);
          if (!transaction.has_value()) {
            return std::nullopt;
          }
          return make_transaction_view(*view, std::move(*transaction));
        },
        stop);
  });
}

resolution<connection<transaction_view>> resolver::address_transactions(
    const std::string_view bech32,
    const pagination_arguments& arguments,
    const std::stop_token& stop) const {
  auto normalized = normalize_address(bech32);
  if (!normalized.has_value()) {
    return failed<connection<transaction_view>>(
        query_error_code::invalid_argument, "invalid bech32 address");
  }
  auto view = indexer_.view();
  const auto& id = *normalized;
  auto history = view->address_transactions.find(id);
  if (history == std::end(view->address_transactions)) {
    return failed<connection<transaction_view>>(
        query_error_code::not_found, "address " + id + " has no transactions");
  }
  const auto& transactions = history->second;
  auto key = sequence_key{.kind = sequence_kind::address_transactions,
                          .scope = encode_scope(id)};
  return paginate<transaction_view>(
      key, bounds_of_size(transactions.size()), arguments, max_page_size_,
      [&](const uint64_t position) -> std::optional<transaction_view> {
        auto transaction = indexer_.store().get_transaction(transactions[position]);
        if (!transaction.has_value()) {
          return std::nullopt;
        }
        return make_transaction_view(*view, std::move(*transaction));
      },
      stop);
}

resolution<connection<block_view>> resolver::stake_pool_blocks(
    const pool_id_t& id,
    const pagination_arguments& arguments,
    const std::stop_token& stop) const {
  return guarded<connection<block_view>>([&] {
    auto view = indexer_.view();
    if (!indexer_.store().get_stake_pool(id).has_value()) {
      return failed<connection<block_view>>(
          query_error_code::not_found, "stake pool " + to_hex(id) + " not found");
    }
    static const auto kNoBlocks = std::vector<block_id_t>{};
    auto it = view->pool_blocks.find(id);
    const auto& blocks =
        it == std::end(view->pool_blocks) ? kNoBlocks : it->second;
    auto key = sequence_key{.kind = sequence_kind::stake_pool_blocks,
                            .scope = encode_scope(id)};
    return paginate<block_view>(
        key, bounds_of_size(blocks.size()), arguments, max_page_size_,
        [&](const uint64_t position) -> std::optional<block_view> {
          auto slot = view->dag.find(blocks[position]);
          if (!slot.has_value()) {
            return std::nullopt;
          }
          return load_block_view(*view, indexer_.store(), *slot);
        },
        stop);
  });
}

resolution<connection<vote_record>> resolver::proposal_votes(
    const vote_plan_id_t& id,
    const uint8_t proposal_index,
    const pagination_arguments& arguments,
    const std::stop_token& stop) const {
  return guarded<connection<vote_record>>([&] {
    auto plan = indexer_.store().get_vote_plan(id);
    if (!plan.has_value() || proposal_index >= plan->proposals.size()) {
      return failed<connection<vote_record>>(
          query_error_code::not_found,
          "proposal " + std::to_string(proposal_index) + " of vote plan " +
              to_hex(id) + " not found");
    }
    auto key = sequence_key{.kind = sequence_kind::proposal_votes,
                            .scope = encode_scope(std::tuple{id, proposal_index})};
    return paginate<vote_record>(
        key, bounds_of_size(plan->proposals[proposal_index].votes_count),
        arguments, max_page_size_,
        [&](const uint64_t position) {
          return indexer_.store().get_vote(id, proposal_index, position);
        },
        stop);
  });
}

query_result_t resolver::query(const std::string_view path,
                               const bytes_view_t& data,
                               const std::stop_token& stop) const {
  auto out = query_result_t{};
  out.key = make_bytes(data);
  out.codespace = std::string{kCodespace};
  out.info = std::string{path};
  {
    auto view = indexer_.view();
    if (auto main = view->tracker.main()) {
      out.height = view->dag.node(main->tip).chain_length;
    }
  }

  using hash_request_t = std::tuple<hash32_t>;

  if (path == "/block") {
    dispatch<hash_request_t>(out, data,
                             [&](const hash32_t& id) { return block(id); });
  } else if (path == "/blocks/by_chain_length") {
    dispatch<std::tuple<chain_length_t>>(out, data, [&](const chain_length_t length) {
      return blocks_by_chain_length(length);
    });
  } else if (path == "/transaction") {
    dispatch<hash_request_t>(out, data,
                             [&](const hash32_t& id) { return transaction(id); });
  } else if (path == "/branches") {
    fill(out, branches());
  } else if (path == "/tip") {
    fill(out, tip());
  } else if (path == "/branch") {
    dispatch<std::tuple<branch_id_t>>(out, data,
                                      [&](const branch_id_t id) { return branch(id); });
  } else if (path == "/epoch") {
    dispatch<std::tuple<epoch_t, std::optional<branch_id_t>>>(
        out, data, [&](const epoch_t id, const std::optional<branch_id_t> on) {
          return epoch(id, on);
        });
  } else if (path == "/address") {
    dispatch<std::tuple<std::string>>(
        out, data, [&](const std::string& id) { return address(id); });
  } else if (path == "/stake_pool") {
    dispatch<hash_request_t>(out, data,
                             [&](const hash32_t& id) { return stake_pool(id); });
  } else if (path == "/settings") {
    fill(out, settings());
  } else if (path == "/vote_plan") {
    dispatch<hash_request_t>(out, data,
                             [&](const hash32_t& id) { return vote_plan(id); });
  } else if (path == "/branch/blocks") {
    dispatch<std::tuple<branch_id_t, pagination_arguments>>(
        out, data, [&](const branch_id_t id, const pagination_arguments& args) {
          return branch_blocks(id, args, stop);
        });
  } else if (path == "/branch/stake_pools") {
    dispatch<std::tuple<branch_id_t, pagination_arguments>>(
        out, data, [&](const branch_id_t id, const pagination_arguments& args) {
          return branch_stake_pools(id, args, stop);
        });
  } else if (path == "/branch/vote_plans") {
    dispatch<std::tuple<branch_id_t, pagination_arguments>>(
        out, data, [&](const branch_id_t id, const pagination_arguments& args) {
          return branch_vote_plans(id, args, stop);
        });
  } else if (path == "/epoch/blocks") {
    dispatch<std::tuple<epoch_t, std::optional<branch_id_t>, pagination_arguments>>(
        out, data,
        [&](const epoch_t id, const std::optional<branch_id_t> on,
            const pagination_arguments& args) {
          return epoch_blocks(id, on, args, stop);
        });
  } else if (path == "/block/transactions") {
    dispatch<std::tuple<hash32_t, pagination_arguments>>(
        out, data, [&](const hash32_t& id, const pagination_arguments& args) {
          return block_transactions(id, args, stop);
        });
  } else if (path == "/address/transactions") {
    dispatch<std::tuple<std::string, pagination_arguments>>(
        out, data, [&](const std::string& id, const pagination_arguments& args) {
          return address_transactions(id, args, stop);
        });
  } else if (path == "/stake_pool/blocks") {
    dispatch<std::tuple<hash32_t, pagination_arguments>>(
        out, data, [&](const hash32_t& id, const pagination_arguments& args) {
          return stake_pool_blocks(id, args, stop);
        });
  } else if (path == "/vote_plan/proposal/votes") {
    dispatch<std::tuple<hash32_t, uint8_t, pagination_arguments>>(
        out, data,
        [&](const hash32_t& id, const uint8_t proposal,
            const pagination_arguments& args) {
          return proposal_votes(id, proposal, args, stop);
        });
  } else {
    out.code = query_error_code::unsupported_path;
    out.log = "unsupported query path '" + std::string{path} + "'";
  }

  if (!out.ok()) {
    spdlog::debug("Query {} failed with {}: {}", path, to_string(out.code),
                  out.log);
  }
  return out;
}

}  // namespace explorer::query
