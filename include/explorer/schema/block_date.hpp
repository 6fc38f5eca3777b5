#pragma once

#include <explorer/schema/primitives.hpp>
#include <compare>
#include <string>

// Schema type: block date.
// Ledger view: (epoch, slot) pair; the composite ordering key of blocks.
namespace explorer::schema {

struct block_date final {
  epoch_t epoch{};
  slot_t slot{};

  auto operator<=>(const block_date&) const = default;
};

inline std::string to_string(const block_date& date) {
  return std::to_string(date.epoch) + "." + std::to_string(date.slot);
}

}  // namespace explorer::schema
