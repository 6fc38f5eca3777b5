#pragma once

#include <explorer/blake3/hash.hpp>
#include <explorer/schema/bech32.hpp>
#include <explorer/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace explorer::testing {

inline explorer::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = explorer::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline explorer::schema::hash32_t make_hash(const std::string_view seed) {
  return explorer::blake3::hash(seed);
}

/// Valid bech32 address whose key is derived from `seed`.
inline explorer::schema::address_t make_address(const std::string_view seed) {
  auto key = explorer::blake3::hash(seed);
  auto words = explorer::schema::convert_bits(
      explorer::schema::bytes_view_t{key.data(), key.size()}, 8, 5, true);
  return explorer::schema::encode_bech32(
      "addr", explorer::schema::make_bytes_view(words.value()));
}

/// Fresh scratch directory name; unique across the parallel processes
/// ctest starts for discovered tests.
inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  auto name = std::string{prefix} + "_" + std::to_string(::getpid()) + "_" +
              std::to_string(counter.fetch_add(1)) + "_" +
              std::to_string(std::chrono::steady_clock::now()
                                 .time_since_epoch()
                                 .count());
  return (std::filesystem::temp_directory_path() / name).string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace explorer::testing
