#pragma once

#include <explorer/schema/certificate.hpp>
#include <explorer/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: stake pool state.
// Ledger view: mutable aggregate of a registered pool. Delegated stake is the
// running sum of the balances of addresses delegating to the pool.
namespace explorer::schema {

template <uint16_t Version>
struct stake_pool_state;

template <>
struct stake_pool_state<1> final {
  uint16_t version{1};
  pool_id_t id{};
  pool_registration registration{};
  std::optional<pool_retirement> retirement;
  value_t delegated_stake{};
};

using stake_pool_state_t = stake_pool_state<1>;

}  // namespace explorer::schema
