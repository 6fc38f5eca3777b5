#pragma once

#include <explorer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: vote plan payload type.
// Ledger view: whether votes and tallies of a plan are plaintext or encrypted.
namespace explorer::schema {

enum class payload_type_t : uint8_t { public_payload = 0, private_payload = 1 };

template <>
struct enum_names<payload_type_t> final {
  static constexpr auto names = std::array<std::string_view, 2>{
      "public",
      "private"};
};

inline constexpr std::string_view to_string(const payload_type_t value) {
  return enum_name(value);
}

}  // namespace explorer::schema
