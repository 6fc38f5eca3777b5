#pragma once

#include <explorer/index/block_dag.hpp>
#include <explorer/schema/primitives.hpp>
#include <compare>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace explorer::index {

struct branch_record final {
  explorer::schema::branch_id_t id{};
  slot_t tip{kNoSlot};
  bool live{true};
};

/// Total order over branch tips supplied by the ledger. `greater` means the
/// left tip is preferred.
using ledger_order_t =
    std::function<std::strong_ordering(const dag_node&, const dag_node&)>;

/// Lexicographic (chain length, score).
std::strong_ordering default_ledger_order(const dag_node& lhs,
                                          const dag_node& rhs);

struct tip_update final {
  bool excluded{};
  std::optional<explorer::schema::branch_id_t> branch;
  bool main_changed{};
  std::optional<explorer::schema::branch_id_t> main;
  std::vector<explorer::schema::branch_id_t> retired;
  bool watermark_advanced{};
};

/// State machine over the live branch tips of a block_dag.
///
/// Extending a live tip keeps its branch id; any other block opens a new
/// branch. A live branch that falls more than `retention_window` behind main
/// is retired: it keeps resolving by id but is no longer listed. Confirmation
/// is a watermark block that only moves forward along its own descendants.
class branch_tracker final {
 public:
  branch_tracker(const block_dag& dag,
                 uint32_t epoch_stability_depth,
                 uint32_t retention_window,
                 ledger_order_t order = default_ledger_order);

  /// Register a freshly linked block. When the block does not descend from
  /// the confirmation watermark (or from an excluded parent) the update is
  /// flagged `excluded` and no branch changes.
  tip_update on_linked(slot_t slot);

  std::vector<branch_record> live_branches() const;
  std::optional<branch_record> find(explorer::schema::branch_id_t id) const;
  std::optional<branch_record> main() const;

  /// Live branches whose tip descends from `slot`.
  std::vector<explorer::schema::branch_id_t> branches_containing(
      slot_t slot) const;

  bool is_confirmed(slot_t slot) const;
  slot_t confirmed_watermark() const { return watermark_; }

  uint32_t epoch_stability_depth() const { return epoch_stability_depth_; }
  uint32_t retention_window() const { return retention_window_; }

 private:
  bool select_main();
  std::vector<explorer::schema::branch_id_t> retire_stale();
  bool advance_confirmation();

  const block_dag& dag_;
  uint32_t epoch_stability_depth_;
  uint32_t retention_window_;
  ledger_order_t order_;
  std::map<explorer::schema::branch_id_t, branch_record> branches_;
  std::unordered_map<slot_t, explorer::schema::branch_id_t> live_tips_;
  std::optional<explorer::schema::branch_id_t> main_;
  explorer::schema::branch_id_t next_id_{};
  slot_t watermark_{kNoSlot};
};

}  // namespace explorer::index
