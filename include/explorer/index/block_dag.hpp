#pragma once

#include <explorer/schema/block.hpp>
#include <explorer/schema/block_date.hpp>
#include <explorer/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

namespace explorer::index {

/// Position of a block in the DAG arena. Stable for the lifetime of the index.
using slot_t = uint32_t;

inline constexpr auto kNoSlot = std::numeric_limits<slot_t>::max();

struct dag_node final {
  explorer::schema::block_id_t id{};
  slot_t parent{kNoSlot};
  slot_t skip{kNoSlot};  // ancestor at skip_height(chain_length)
  explorer::schema::chain_length_t chain_length{};
  explorer::schema::block_date date{};
  uint64_t score{};
  bool excluded{};
};

enum class link_status : uint8_t { linked, duplicate, orphan, conflict };

struct link_result final {
  link_status status{link_status::orphan};
  slot_t slot{kNoSlot};
};

class block_dag;

/// Lazy walk from a block back to genesis over parent links. Finite, and
/// restartable by calling begin() again.
class ancestor_range final {
 public:
  class iterator final {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = dag_node;
    using difference_type = std::ptrdiff_t;
    using pointer = const dag_node*;
    using reference = const dag_node&;

    iterator() = default;
    iterator(const block_dag* dag, slot_t slot) : dag_{dag}, slot_{slot} {}

    reference operator*() const;
    pointer operator->() const { return &**this; }
    iterator& operator++();
    iterator operator++(int) {
      auto copy = *this;
      ++*this;
      return copy;
    }
    bool operator==(const iterator& other) const {
      return slot_ == other.slot_;
    }
    slot_t slot() const { return slot_; }

   private:
    const block_dag* dag_{nullptr};
    slot_t slot_{kNoSlot};
  };

  ancestor_range(const block_dag& dag, slot_t start)
      : dag_{&dag}, start_{start} {}

  iterator begin() const { return iterator{dag_, start_}; }
  iterator end() const { return iterator{dag_, kNoSlot}; }

 private:
  const block_dag* dag_;
  slot_t start_;
};

/// Arena of every linked block with explicit parent edges.
///
/// Each node also carries a skip link to an ancestor chosen so that
/// `ancestor_at` runs in O(log n). Nodes are never removed; blocks cut off by
/// a consistency violation are flagged `excluded` instead.
class block_dag final {
 public:
  /// Link a block whose chain length has already been derived from its
  /// parent. Genesis is the only block without a parent and must have chain
  /// length 0.
  link_result ingest(const explorer::schema::block_t& block);

  std::optional<slot_t> find(const explorer::schema::block_id_t& id) const;
  const dag_node& node(slot_t slot) const;
  std::size_t size() const { return nodes_.size(); }
  std::optional<slot_t> genesis() const;

  ancestor_range ancestor_chain(slot_t slot) const;
  std::optional<ancestor_range> ancestor_chain(
      const explorer::schema::block_id_t& id) const;

  /// Every slot at the given chain length, in ingestion order.
  const std::vector<slot_t>& blocks_at_chain_length(
      explorer::schema::chain_length_t length) const;

  /// Ancestor of `slot` at `length`, or kNoSlot when length exceeds the
  /// block's own chain length.
  slot_t ancestor_at(slot_t slot, explorer::schema::chain_length_t length) const;

  bool is_ancestor(slot_t ancestor, slot_t descendant) const;
  slot_t common_ancestor(slot_t lhs, slot_t rhs) const;

  /// Flag a block and every linked descendant as excluded.
  std::vector<slot_t> exclude_subtree(slot_t slot);

 private:
  std::vector<dag_node> nodes_;
  std::vector<std::vector<slot_t>> children_;
  std::unordered_map<explorer::schema::block_id_t,
                     slot_t,
                     explorer::schema::hash32_hasher>
      by_id_;
  std::vector<std::vector<slot_t>> by_chain_length_;
};

/// Height of the skip target for a node at `length`.
explorer::schema::chain_length_t skip_length(
    explorer::schema::chain_length_t length);

}  // namespace explorer::index
