#pragma once

#include <explorer/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: address state.
// Ledger view: delegation target and running balance of an address, summed
// over every ingested transaction regardless of branch.
namespace explorer::schema {

template <uint16_t Version>
struct address_state;

template <>
struct address_state<1> final {
  uint16_t version{1};
  address_t address;
  std::optional<pool_id_t> delegation;
  value_t balance{};
};

using address_state_t = address_state<1>;

}  // namespace explorer::schema
