#pragma once
#include <explorer/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace explorer::storage {

using key_value_entry_t =
    std::pair<explorer::schema::bytes_t, explorer::schema::bytes_t>;

struct storage_options final {
  bool sync_writes{false};  // fsync the write-ahead log on every write
  std::size_t block_cache_bytes{std::size_t{64} << 20u};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  ///
  /// A present value that fails to decode raises
  /// `explorer::common::internal_consistency_error`.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const explorer::schema::bytes_view_t& key) const;

  /// Atomically persist every pre-encoded entry.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;

  /// Visit every entry under `prefix` in key order. `visit(key, value)`
  /// returns false to stop early. Views are valid only during the call.
  template <typename Visitor>
  void scan_prefix(const explorer::schema::bytes_view_t& prefix,
                   Visitor&& visit) const;
};

/// Open (creating if needed) a storage backend rooted at a filesystem path.
template <typename Library>
storage<Library> make_storage(std::string_view path,
                              const storage_options& options);

}  // namespace explorer::storage
