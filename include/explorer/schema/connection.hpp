#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: connection.
// Read API: the page shape shared by every paginated field.
namespace explorer::schema {

struct pagination_arguments final {
  std::optional<uint64_t> first;
  std::optional<uint64_t> last;
  std::optional<std::string> before;
  std::optional<std::string> after;
};

struct page_info final {
  bool has_previous_page{};
  bool has_next_page{};
  std::optional<std::string> start_cursor;
  std::optional<std::string> end_cursor;
};

/// A node that failed to resolve is reported as `error` with no node; the
/// cursor is still valid.
template <typename T>
struct edge final {
  std::optional<T> node;
  std::string cursor;
  std::optional<std::string> error;
};

template <typename T>
struct connection final {
  std::vector<edge<T>> edges;
  page_info page{};
  uint64_t total_count{};
};

}  // namespace explorer::schema
