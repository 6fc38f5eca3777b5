#pragma once

#include <explorer/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: settings.
// Ledger view: fee settings and the epoch stability depth reported to clients.
namespace explorer::schema {

struct per_certificate_fees final {
  std::optional<non_zero_t> pool_registration;
  std::optional<non_zero_t> stake_delegation;
  std::optional<non_zero_t> owner_stake_delegation;
};

struct per_vote_certificate_fees final {
  std::optional<non_zero_t> vote_plan;
  std::optional<non_zero_t> vote_cast;
};

struct fee_settings final {
  value_t constant{};
  value_t coefficient{};
  value_t certificate{};
  per_certificate_fees per_certificate{};
  per_vote_certificate_fees per_vote_certificate{};
};

template <uint16_t Version>
struct settings;

template <>
struct settings<1> final {
  uint16_t version{1};
  fee_settings fees{};
  uint32_t epoch_stability_depth{10};
};

using settings_t = settings<1>;

}  // namespace explorer::schema
