#include <explorer/index/branch_tracker.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

namespace explorer::index {

using namespace explorer::schema;

std::strong_ordering default_ledger_order(const dag_node& lhs,
                                          const dag_node& rhs) {
  if (auto order = lhs.chain_length <=> rhs.chain_length; order != 0) {
    return order;
  }
  return lhs.score <=> rhs.score;
}

branch_tracker::branch_tracker(const block_dag& dag,
                               uint32_t epoch_stability_depth,
                               uint32_t retention_window,
                               ledger_order_t order)
    : dag_{dag},
      epoch_stability_depth_{epoch_stability_depth},
      retention_window_{retention_window},
      order_{order ? std::move(order) : ledger_order_t{default_ledger_order}} {}

tip_update branch_tracker::on_linked(const slot_t slot) {
  auto update = tip_update{};
  const auto& node = dag_.node(slot);

  if (node.parent != kNoSlot && dag_.node(node.parent).excluded) {
    update.excluded = true;
    return update;
  }
  if (watermark_ != kNoSlot && !dag_.is_ancestor(watermark_, slot)) {
    spdlog::critical(
        "Block {} at chain length {} does not descend from confirmed block {}",
        to_hex(node.id), node.chain_length, to_hex(dag_.node(watermark_).id));
    update.excluded = true;
    return update;
  }

  if (auto it = live_tips_.find(node.parent); it != std::end(live_tips_)) {
    auto id = it->second;
    live_tips_.erase(it);
    live_tips_.emplace(slot, id);
    branches_[id].tip = slot;
    update.branch = id;
  } else {
    auto id = next_id_++;
    branches_.emplace(id, branch_record{.id = id, .tip = slot, .live = true});
    live_tips_.emplace(slot, id);
    update.branch = id;
    spdlog::debug("Branch {} opened at block {} (chain length {})", id,
                  to_hex(node.id), node.chain_length);
  }

  update.main_changed = select_main();
  update.retired = retire_stale();
  update.main = main_;
  update.watermark_advanced = advance_confirmation();
  return update;
}

bool branch_tracker::select_main() {
  auto best = std::optional<branch_id_t>{};
  if (main_.has_value() && branches_.at(*main_).live) {
    best = main_;
  }
  for (const auto& [id, branch] : branches_) {
    if (!branch.live) {
      continue;
    }
    if (!best.has_value()) {
      best = id;
      continue;
    }
    // Equal order keeps the incumbent.
    if (order_(dag_.node(branch.tip), dag_.node(branches_.at(*best).tip)) ==
        std::strong_ordering::greater) {
      best = id;
    }
  }
  if (best == main_) {
    return false;
  }
  main_ = best;
  if (main_.has_value()) {
    const auto& tip = dag_.node(branches_.at(*main_).tip);
    spdlog::info("Main branch is now {} at block {} (chain length {})", *main_,
                 to_hex(tip.id), tip.chain_length);
  }
  return true;
}

std::vector<branch_id_t> branch_tracker::retire_stale() {
  auto retired = std::vector<branch_id_t>{};
  if (!main_.has_value()) {
    return retired;
  }
  auto main_length = dag_.node(branches_.at(*main_).tip).chain_length;
  for (auto& [id, branch] : branches_) {
    if (!branch.live || id == *main_) {
      continue;
    }
    auto length = dag_.node(branch.tip).chain_length;
    if (main_length > length && main_length - length > retention_window_) {
      branch.live = false;
      live_tips_.erase(branch.tip);
      retired.push_back(id);
      spdlog::debug("Branch {} retired {} blocks behind main", id,
                    main_length - length);
    }
  }
  return retired;
}

bool branch_tracker::advance_confirmation() {
  if (live_tips_.empty()) {
    return false;
  }
  auto shortest = std::numeric_limits<chain_length_t>::max();
  auto common = kNoSlot;
  for (const auto& [tip, id] : live_tips_) {
    shortest = std::min(shortest, dag_.node(tip).chain_length);
    common = common == kNoSlot ? tip : dag_.common_ancestor(common, tip);
  }
  if (common == kNoSlot || shortest < epoch_stability_depth_) {
    return false;
  }

  auto target = std::min(dag_.node(common).chain_length,
                         shortest - epoch_stability_depth_);
  auto candidate = dag_.ancestor_at(common, target);
  if (candidate == kNoSlot) {
    return false;
  }
  if (watermark_ != kNoSlot) {
    if (dag_.node(candidate).chain_length <=
        dag_.node(watermark_).chain_length) {
      return false;
    }
    if (!dag_.is_ancestor(watermark_, candidate)) {
      spdlog::critical(
          "Confirmation watermark {} is not an ancestor of candidate {}",
          to_hex(dag_.node(watermark_).id), to_hex(dag_.node(candidate).id));
      return false;
    }
  }
  watermark_ = candidate;
  spdlog::debug("Confirmed up to block {} (chain length {})",
                to_hex(dag_.node(candidate).id),
                dag_.node(candidate).chain_length);
  return true;
}

std::vector<branch_record> branch_tracker::live_branches() const {
  auto out = std::vector<branch_record>{};
  for (const auto& [id, branch] : branches_) {
    if (branch.live) {
      out.push_back(branch);
    }
  }
  return out;
}

std::optional<branch_record> branch_tracker::find(const branch_id_t id) const {
  auto it = branches_.find(id);
  if (it == std::end(branches_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<branch_record> branch_tracker::main() const {
  if (!main_.has_value()) {
    return std::nullopt;
  }
  return branches_.at(*main_);
}

std::vector<branch_id_t> branch_tracker::branches_containing(
    const slot_t slot) const {
  auto out = std::vector<branch_id_t>{};
  for (const auto& [id, branch] : branches_) {
    if (branch.live && dag_.is_ancestor(slot, branch.tip)) {
      out.push_back(id);
    }
  }
  return out;
}

bool branch_tracker::is_confirmed(const slot_t slot) const {
  if (watermark_ == kNoSlot || slot == kNoSlot) {
    return false;
  }
  const auto& node = dag_.node(slot);
  return node.chain_length <= dag_.node(watermark_).chain_length &&
         dag_.ancestor_at(watermark_, node.chain_length) == slot;
}

}  // namespace explorer::index
