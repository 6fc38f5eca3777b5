#pragma once

#include <explorer/schema/block.hpp>
#include <explorer/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

namespace explorer::index {

/// Bounded buffer of applied blocks whose parent has not been linked yet,
/// keyed by the missing parent. The oldest block is evicted at capacity.
/// Not synchronized; the indexer only touches it under its ingestion lock.
class orphan_pool final {
 public:
  explicit orphan_pool(std::size_t capacity);

  /// Buffer a block. Returns false when the block is already buffered.
  bool add(explorer::schema::applied_block_t block);

  /// Remove and return every buffered block waiting on `parent`, in arrival
  /// order.
  std::vector<explorer::schema::applied_block_t> take_children(
      const explorer::schema::block_id_t& parent);

  bool contains(const explorer::schema::block_id_t& id) const;
  std::size_t size() const { return by_sequence_.size(); }
  std::size_t capacity() const { return capacity_; }

 private:
  void erase(uint64_t sequence);

  std::size_t capacity_;
  uint64_t sequence_{};
  std::map<uint64_t, explorer::schema::applied_block_t> by_sequence_;
  std::unordered_map<explorer::schema::block_id_t,
                     uint64_t,
                     explorer::schema::hash32_hasher>
      by_id_;
  std::unordered_map<explorer::schema::block_id_t,
                     std::vector<uint64_t>,
                     explorer::schema::hash32_hasher>
      by_parent_;
};

}  // namespace explorer::index
