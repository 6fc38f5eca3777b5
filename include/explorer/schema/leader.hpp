#pragma once

#include <explorer/schema/primitives.hpp>
#include <variant>

// Schema type: leader.
// Ledger view: producer of a block, either a stake pool or a BFT leader.
namespace explorer::schema {

struct pool_leader final {
  pool_id_t pool_id{};

  bool operator==(const pool_leader&) const = default;
};

struct bft_leader final {
  hash32_t public_key{};

  bool operator==(const bft_leader&) const = default;
};

using leader_t = std::variant<pool_leader, bft_leader>;

}  // namespace explorer::schema
