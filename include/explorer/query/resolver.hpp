#pragma once

#include <explorer/index/indexer.hpp>
#include <explorer/query/pagination.hpp>
#include <explorer/query/resolution.hpp>
#include <explorer/schema/connection.hpp>
#include <explorer/schema/primitives.hpp>
#include <explorer/schema/query_result.hpp>
#include <explorer/schema/settings.hpp>
#include <explorer/schema/vote_plan_state.hpp>
#include <explorer/schema/views.hpp>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

namespace explorer::query {

/// Read side of the explorer: typed lookups, connections and the path
/// routed `query` entry point used by the gRPC service.
///
/// Every operation takes a shared view of the index for its whole duration,
/// so a page is resolved against one consistent set of tips and sequences.
/// Lookups that miss return `not_found`; a record that fails to decode
/// returns `internal_consistency` for a lookup and an edge error inside a
/// page.
class resolver final {
 public:
  resolver(const explorer::index::indexer& indexer,
           explorer::schema::settings_t settings,
           uint64_t max_page_size);

  resolution<explorer::schema::block_view> block(
      const explorer::schema::block_id_t& id) const;
  resolution<std::vector<explorer::schema::block_view>> blocks_by_chain_length(
      explorer::schema::chain_length_t length) const;
  resolution<explorer::schema::transaction_view> transaction(
      const explorer::schema::transaction_id_t& id) const;
  resolution<std::vector<explorer::schema::branch_view>> branches() const;
  resolution<explorer::schema::branch_view> tip() const;
  resolution<explorer::schema::branch_view> branch(
      explorer::schema::branch_id_t id) const;
  /// Epoch on `branch`, or on the main branch when none is given.
  resolution<explorer::schema::epoch_view> epoch(
      explorer::schema::epoch_t id,
      std::optional<explorer::schema::branch_id_t> branch) const;
  resolution<explorer::schema::address_view> address(
      std::string_view bech32) const;
  resolution<explorer::schema::stake_pool_view> stake_pool(
      const explorer::schema::pool_id_t& id) const;
  resolution<explorer::schema::settings_t> settings() const;
  resolution<explorer::schema::vote_plan_view> vote_plan(
      const explorer::schema::vote_plan_id_t& id) const;

  resolution<explorer::schema::connection<explorer::schema::block_view>>
  branch_blocks(explorer::schema::branch_id_t branch,
                const explorer::schema::pagination_arguments& arguments,
                const std::stop_token& stop = {}) const;
  resolution<explorer::schema::connection<explorer::schema::stake_pool_view>>
  branch_stake_pools(explorer::schema::branch_id_t branch,
                     const explorer::schema::pagination_arguments& arguments,
                     const std::stop_token& stop = {}) const;
  resolution<explorer::schema::connection<explorer::schema::vote_plan_view>>
  branch_vote_plans(explorer::schema::branch_id_t branch,
                    const explorer::schema::pagination_arguments& arguments,
                    const std::stop_token& stop = {}) const;
  resolution<explorer::schema::connection<explorer::schema::block_view>>
  epoch_blocks(explorer::schema::epoch_t epoch,
               std::optional<explorer::schema::branch_id_t> branch,
               const explorer::schema::pagination_arguments& arguments,
               const std::stop_token& stop = {}) const;
  resolution<explorer::schema::connection<explorer::schema::transaction_view>>
  block_transactions(const explorer::schema::block_id_t& id,
                     const explorer::schema::pagination_arguments& arguments,
                     const std::stop_token& stop = {}) const;
  resolution<explorer::schema::connection<explorer::schema::transaction_view>>
  address_transactions(std::string_view bech32,
                       const explorer::schema::pagination_arguments& arguments,
                       const std::stop_token& stop = {}) const;
  resolution<explorer::schema::connection<explorer::schema::block_view>>
  stake_pool_blocks(const explorer::schema::pool_id_t& id,
                    const explorer::schema::pagination_arguments& arguments,
                    const std::stop_token& stop = {}) const;
  resolution<explorer::schema::connection<explorer::schema::vote_record>>
  proposal_votes(const explorer::schema::vote_plan_id_t& id,
                 uint8_t proposal_index,
                 const explorer::schema::pagination_arguments& arguments,
                 const std::stop_token& stop = {}) const;

  /// Route a SCALE encoded request by path. `height` in the result is the
  /// main tip chain length at resolution time.
  explorer::schema::query_result_t query(
      std::string_view path,
      const explorer::schema::bytes_view_t& data,
      const std::stop_token& stop = {}) const;

  uint64_t max_page_size() const { return max_page_size_; }

 private:
  const explorer::index::indexer& indexer_;
  explorer::schema::settings_t settings_;
  uint64_t max_page_size_;
};

/// Tally status of one proposal, dispatched on the plan's payload type.
std::optional<explorer::schema::tally_status_t> make_tally_status(
    explorer::schema::payload_type_t payload_type,
    const explorer::schema::proposal_state& proposal);

explorer::schema::vote_plan_view make_vote_plan_view(
    const explorer::schema::vote_plan_state_t& plan);

}  // namespace explorer::query
