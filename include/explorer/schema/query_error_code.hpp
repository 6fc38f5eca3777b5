#pragma once

#include <explorer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: query error code.
// Read path failure taxonomy: stable numeric codes carried in `query_result`.
namespace explorer::schema {

enum class query_error_code : uint32_t {
  ok = 0,
  invalid_argument = 1,
  not_found = 2,
  unsupported_path = 3,
  invalid_cursor = 4,
  internal_consistency = 5,
  cancelled = 6,
};

template <>
struct enum_names<query_error_code> final {
  static constexpr auto names = std::array<std::string_view, 7>{
      "ok",
      "invalid_argument",
      "not_found",
      "unsupported_path",
      "invalid_cursor",
      "internal_consistency",
      "cancelled"};
};

inline constexpr std::string_view to_string(const query_error_code value) {
  return enum_name(value);
}

}  // namespace explorer::schema
