#pragma once

#include <csignal>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace explorer::common {

[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Raised when a stored record cannot be decoded or does not match the shape
/// the index expects. Scoped to a single record; callers decide whether the
/// fault aborts a lookup or only one edge of a page.
class internal_consistency_error final : public std::runtime_error {
 public:
  explicit internal_consistency_error(const std::string& message)
      : std::runtime_error{message} {}
};

}  // namespace explorer::common
