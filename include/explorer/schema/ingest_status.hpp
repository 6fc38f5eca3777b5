#pragma once

#include <explorer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: ingest status.
// Feed outcome of one applied block. `orphan` is never surfaced to queries.
namespace explorer::schema {

enum class ingest_status_t : uint8_t {
  linked = 0,
  duplicate = 1,
  orphan = 2,
  conflict = 3,
  excluded = 4,
  rejected = 5
};

template <>
struct enum_names<ingest_status_t> final {
  static constexpr auto names = std::array<std::string_view, 6>{
      "linked",
      "duplicate",
      "orphan",
      "conflict",
      "excluded",
      "rejected"};
};

inline constexpr std::string_view to_string(const ingest_status_t value) {
  return enum_name(value);
}

}  // namespace explorer::schema
