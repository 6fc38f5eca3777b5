#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace explorer::schema {

/// Specialize with `static constexpr std::array<std::string_view, N> names`
/// holding the enumerator names in underlying value order. Enumerators must
/// be numbered 0..N-1.
template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::string_view enum_name(const Enum value) {
  const auto& names = enum_names<Enum>::names;
  auto index = static_cast<std::size_t>(value);
  if (index >= names.size()) {
    return "unknown";
  }
  return names[index];
}

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  const auto& names = enum_names<Enum>::names;
  for (auto i = std::size_t{0}; i < names.size(); ++i) {
    if (names[i] == value) {
      return static_cast<Enum>(i);
    }
  }
  return std::nullopt;
}

}  // namespace explorer::schema
