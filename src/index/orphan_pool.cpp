#include <explorer/index/orphan_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace explorer::index {

using namespace explorer::schema;

orphan_pool::orphan_pool(std::size_t capacity)
    : capacity_{std::max(capacity, std::size_t{1})} {}

bool orphan_pool::add(applied_block_t block) {
  if (!block.parent_id.has_value() || contains(block.id)) {
    return false;
  }

  if (by_sequence_.size() >= capacity_) {
    auto oldest = std::begin(by_sequence_);
    spdlog::warn("Orphan pool full ({}), evicting block {}", capacity_,
                 to_hex(oldest->second.id));
    erase(oldest->first);
  }

  auto sequence = ++sequence_;
  by_id_.emplace(block.id, sequence);
  by_parent_[*block.parent_id].push_back(sequence);
  spdlog::debug("Orphan pool buffered block {} awaiting parent {}",
                to_hex(block.id), to_hex(*block.parent_id));
  by_sequence_.emplace(sequence, std::move(block));
  return true;
}

std::vector<applied_block_t> orphan_pool::take_children(
    const block_id_t& parent) {
  auto out = std::vector<applied_block_t>{};
  auto it = by_parent_.find(parent);
  if (it == std::end(by_parent_)) {
    return out;
  }
  auto sequences = std::move(it->second);
  by_parent_.erase(it);
  for (const auto sequence : sequences) {
    auto entry = by_sequence_.find(sequence);
    if (entry == std::end(by_sequence_)) {
      continue;
    }
    by_id_.erase(entry->second.id);
    out.push_back(std::move(entry->second));
    by_sequence_.erase(entry);
  }
  return out;
}

bool orphan_pool::contains(const block_id_t& id) const {
  return by_id_.contains(id);
}

void orphan_pool::erase(const uint64_t sequence) {
  auto entry = by_sequence_.find(sequence);
  if (entry == std::end(by_sequence_)) {
    return;
  }
  const auto& block = entry->second;
  by_id_.erase(block.id);
  if (auto siblings = by_parent_.find(*block.parent_id);
      siblings != std::end(by_parent_)) {
    std::erase(siblings->second, sequence);
    if (siblings->second.empty()) {
      by_parent_.erase(siblings);
    }
  }
  by_sequence_.erase(entry);
}

}  // namespace explorer::index
