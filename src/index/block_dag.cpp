#include <explorer/common/critical.hpp>
#include <explorer/index/block_dag.hpp>

#include <algorithm>

namespace explorer::index {

using namespace explorer::schema;

namespace {

chain_length_t invert_lowest_one(const chain_length_t n) {
  return n & (n - 1);
}

const std::vector<slot_t> kEmptySlots{};

}  // namespace

chain_length_t skip_length(const chain_length_t length) {
  if (length < 2) {
    return 0;
  }
  // Odd lengths jump further back so that any ancestor is reachable in a
  // logarithmic number of steps.
  return (length & 1u) != 0
             ? invert_lowest_one(invert_lowest_one(length - 1)) + 1
             : invert_lowest_one(length);
}

const dag_node& ancestor_range::iterator::operator*() const {
  return dag_->node(slot_);
}

ancestor_range::iterator& ancestor_range::iterator::operator++() {
  slot_ = dag_->node(slot_).parent;
  return *this;
}

link_result block_dag::ingest(const block_t& block) {
  if (auto existing = find(block.id)) {
    const auto& node = nodes_[*existing];
    auto parent_matches =
        block.parent_id.has_value()
            ? (node.parent != kNoSlot && nodes_[node.parent].id == *block.parent_id)
            : node.parent == kNoSlot;
    if (parent_matches && node.chain_length == block.chain_length &&
        node.date == block.date && node.score == block.score) {
      return {.status = link_status::duplicate, .slot = *existing};
    }
    return {.status = link_status::conflict, .slot = *existing};
  }

  auto parent = kNoSlot;
  if (block.parent_id.has_value()) {
    auto parent_slot = find(*block.parent_id);
    if (!parent_slot.has_value()) {
      return {.status = link_status::orphan, .slot = kNoSlot};
    }
    parent = *parent_slot;
    if (nodes_[parent].chain_length + 1 != block.chain_length) {
      return {.status = link_status::conflict, .slot = kNoSlot};
    }
  } else if (block.chain_length != 0 || genesis().has_value()) {
    return {.status = link_status::conflict, .slot = kNoSlot};
  }

  auto slot = static_cast<slot_t>(nodes_.size());
  if (slot == kNoSlot) {
    explorer::common::critical("block DAG arena exhausted");
  }
  auto node = dag_node{.id = block.id,
                       .parent = parent,
                       .skip = kNoSlot,
                       .chain_length = block.chain_length,
                       .date = block.date,
                       .score = block.score,
                       .excluded = false};
  if (parent != kNoSlot) {
    node.skip = ancestor_at(parent, skip_length(block.chain_length));
  }
  nodes_.push_back(node);
  children_.emplace_back();
  if (parent != kNoSlot) {
    children_[parent].push_back(slot);
  }
  by_id_.emplace(block.id, slot);
  if (by_chain_length_.size() <= block.chain_length) {
    by_chain_length_.resize(static_cast<std::size_t>(block.chain_length) + 1);
  }
  by_chain_length_[block.chain_length].push_back(slot);
  return {.status = link_status::linked, .slot = slot};
}

std::optional<slot_t> block_dag::find(const block_id_t& id) const {
  auto it = by_id_.find(id);
  if (it == std::end(by_id_)) {
    return std::nullopt;
  }
  return it->second;
}

const dag_node& block_dag::node(const slot_t slot) const {
  if (slot >= nodes_.size()) {
    throw explorer::common::internal_consistency_error{
        "block DAG slot out of range"};
  }
  return nodes_[slot];
}

std::optional<slot_t> block_dag::genesis() const {
  if (by_chain_length_.empty() || by_chain_length_[0].empty()) {
    return std::nullopt;
  }
  return by_chain_length_[0].front();
}

ancestor_range block_dag::ancestor_chain(const slot_t slot) const {
  return ancestor_range{*this, slot};
}

std::optional<ancestor_range> block_dag::ancestor_chain(
    const block_id_t& id) const {
  auto slot = find(id);
  if (!slot.has_value()) {
    return std::nullopt;
  }
  return ancestor_range{*this, *slot};
}

const std::vector<slot_t>& block_dag::blocks_at_chain_length(
    const chain_length_t length) const {
  if (length >= by_chain_length_.size()) {
    return kEmptySlots;
  }
  return by_chain_length_[length];
}

slot_t block_dag::ancestor_at(const slot_t slot,
                              const chain_length_t length) const {
  if (slot == kNoSlot || length > node(slot).chain_length) {
    return kNoSlot;
  }
  auto walk = slot;
  auto walk_length = nodes_[walk].chain_length;
  while (walk_length > length) {
    auto skip = skip_length(walk_length);
    auto skip_previous = skip_length(walk_length - 1);
    const auto& current = nodes_[walk];
    if (current.skip != kNoSlot &&
        (skip == length ||
         (skip > length &&
          !(skip_previous + 2 < skip && skip_previous >= length)))) {
      walk = current.skip;
      walk_length = skip;
    } else {
      walk = current.parent;
      --walk_length;
    }
  }
  return walk;
}

bool block_dag::is_ancestor(const slot_t ancestor,
                            const slot_t descendant) const {
  if (ancestor == kNoSlot || descendant == kNoSlot) {
    return false;
  }
  return ancestor_at(descendant, node(ancestor).chain_length) == ancestor;
}

slot_t block_dag::common_ancestor(slot_t lhs, slot_t rhs) const {
  if (lhs == kNoSlot || rhs == kNoSlot) {
    return kNoSlot;
  }
  auto length = std::min(node(lhs).chain_length, node(rhs).chain_length);
  lhs = ancestor_at(lhs, length);
  rhs = ancestor_at(rhs, length);
  while (lhs != rhs && lhs != kNoSlot && rhs != kNoSlot) {
    lhs = nodes_[lhs].parent;
    rhs = nodes_[rhs].parent;
  }
  return lhs == rhs ? lhs : kNoSlot;
}

std::vector<slot_t> block_dag::exclude_subtree(const slot_t slot) {
  auto excluded = std::vector<slot_t>{};
  auto pending = std::vector<slot_t>{slot};
  while (!pending.empty()) {
    auto current = pending.back();
    pending.pop_back();
    if (nodes_[current].excluded) {
      continue;
    }
    nodes_[current].excluded = true;
    excluded.push_back(current);
    for (const auto child : children_[current]) {
      pending.push_back(child);
    }
  }
  return excluded;
}

}  // namespace explorer::index
