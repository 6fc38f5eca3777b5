#pragma once

#include <explorer/common/critical.hpp>
#include <explorer/query/resolution.hpp>
#include <explorer/schema/connection.hpp>
#include <explorer/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace explorer::query {

/// Every paginated sequence the resolver exposes. Part of the cursor format.
enum class sequence_kind : uint8_t {
  branch_blocks = 1,
  epoch_blocks = 2,
  block_transactions = 3,
  address_transactions = 4,
  stake_pool_blocks = 5,
  stake_pools = 6,
  vote_plans = 7,
  proposal_votes = 8,
};

/// Identity of one concrete sequence: its kind plus the SCALE encoded owner
/// (branch id, block id, address, ...). Cursors from another sequence are
/// rejected.
struct sequence_key final {
  sequence_kind kind{sequence_kind::branch_blocks};
  explorer::schema::bytes_t scope;
};

/// Inclusive position range of a sequence at resolution time. Positions are
/// stable: an element keeps its position for as long as it exists.
struct sequence_bounds final {
  uint64_t lower{};
  std::optional<uint64_t> upper;  // absent for an empty sequence

  bool empty() const { return !upper.has_value() || *upper < lower; }
  uint64_t size() const { return empty() ? 0 : *upper - lower + 1; }
};

/// Positions chosen for one page and the flags computed for it.
struct page_plan final {
  std::vector<uint64_t> positions;
  bool has_previous_page{};
  bool has_next_page{};
  uint64_t total_count{};
};

/// Opaque cursor: base64 of SCALE(kind, scope, position).
std::string encode_cursor(const sequence_key& key, uint64_t position);

/// Position named by `cursor`, or std::nullopt when it does not decode or
/// belongs to another sequence.
std::optional<uint64_t> decode_cursor(const sequence_key& key,
                                      std::string_view cursor);

/// Apply `before`/`after` to establish the window, then pick `first` from
/// its front or `last` from its back. `first` wins when both are present.
/// Page sizes are capped at `max_page_size`.
resolution<page_plan> plan_page(
    const sequence_key& key,
    const sequence_bounds& bounds,
    const explorer::schema::pagination_arguments& arguments,
    uint64_t max_page_size);

/// Resolve one page of a sequence.
///
/// `resolve(position)` returns the node at a position, std::nullopt when the
/// node is gone, or throws internal_consistency_error when its record is
/// corrupt. Either failure becomes an edge error and the page continues.
/// The stop token is checked between edges.
template <typename T, typename Resolve>
resolution<explorer::schema::connection<T>> paginate(
    const sequence_key& key,
    const sequence_bounds& bounds,
    const explorer::schema::pagination_arguments& arguments,
    const uint64_t max_page_size,
    Resolve&& resolve,
    const std::stop_token& stop = {}) {
  using connection_t = explorer::schema::connection<T>;

  auto plan = plan_page(key, bounds, arguments, max_page_size);
  if (!plan.ok()) {
    return failed<connection_t>(plan.code, std::move(plan.log));
  }

  auto out = connection_t{};
  out.total_count = plan.value->total_count;
  out.page.has_previous_page = plan.value->has_previous_page;
  out.page.has_next_page = plan.value->has_next_page;
  out.edges.reserve(plan.value->positions.size());

  for (const auto position : plan.value->positions) {
    if (stop.stop_requested()) {
      return failed<connection_t>(explorer::schema::query_error_code::cancelled,
                                  "page resolution cancelled");
    }
    auto edge = explorer::schema::edge<T>{};
    edge.cursor = encode_cursor(key, position);
    try {
      edge.node = resolve(position);
      if (!edge.node.has_value()) {
        edge.error = "node at position " + std::to_string(position) +
                     " is not available";
      }
    } catch (const explorer::common::internal_consistency_error& ex) {
      spdlog::warn("Edge at position {} failed to resolve: {}", position,
                   ex.what());
      edge.error = ex.what();
    }
    out.edges.push_back(std::move(edge));
  }

  if (!out.edges.empty()) {
    out.page.start_cursor = out.edges.front().cursor;
    out.page.end_cursor = out.edges.back().cursor;
  }
  return resolved(std::move(out));
}

}  // namespace explorer::query
