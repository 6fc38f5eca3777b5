#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace explorer::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using block_id_t = hash32_t;
using transaction_id_t = hash32_t;
using pool_id_t = hash32_t;
using vote_plan_id_t = hash32_t;
using external_proposal_id_t = hash32_t;
using chain_length_t = uint32_t;
using epoch_t = uint32_t;
using slot_t = uint32_t;
using value_t = uint64_t;
using weight_t = uint64_t;
using non_zero_t = uint64_t;  // 0 rejected on decode
using time_offset_seconds_t = uint64_t;
using branch_id_t = uint64_t;
using address_t = std::string;  // bech32

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
std::string make_string(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);

hash32_t make_zero_hash();
/// Accepts 64 hex digits with an optional 0x prefix.
std::optional<hash32_t> try_make_hash32(std::string_view hex);
hash32_t make_hash32(std::string_view hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);

/// Identifiers are content hashes, so their leading bytes are already
/// uniformly distributed.
struct hash32_hasher final {
  std::size_t operator()(const hash32_t& hash) const noexcept {
    auto out = std::size_t{};
    std::memcpy(&out, hash.data(), sizeof(out));
    return out;
  }
};

}  // namespace explorer::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
