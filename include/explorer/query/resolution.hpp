#pragma once

#include <explorer/schema/query_error_code.hpp>
#include <optional>
#include <string>
#include <utility>

namespace explorer::query {

/// Outcome of a typed query: a value on success, otherwise a code and a
/// human readable log line.
template <typename T>
struct resolution final {
  explorer::schema::query_error_code code{explorer::schema::query_error_code::ok};
  std::string log;
  std::optional<T> value;

  bool ok() const { return code == explorer::schema::query_error_code::ok; }
};

template <typename T>
resolution<T> resolved(T value) {
  return resolution<T>{.code = explorer::schema::query_error_code::ok,
                       .log = {},
                       .value = std::move(value)};
}

template <typename T>
resolution<T> failed(explorer::schema::query_error_code code,
                     std::string log) {
  return resolution<T>{.code = code, .log = std::move(log), .value = std::nullopt};
}

}  // namespace explorer::query
