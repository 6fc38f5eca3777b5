#pragma once
#include <explorer/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace explorer::schema {

/// Human readable part and 5-bit data words of a bech32 string, checksum
/// stripped.
struct bech32_parts final {
  std::string hrp;
  bytes_t data;
};

std::optional<bech32_parts> try_decode_bech32(const std::string_view value);
std::string encode_bech32(const std::string_view hrp, const bytes_view_t& data);

/// Regroup 8-bit bytes into 5-bit words (pad = true) or back (pad = false).
std::optional<bytes_t> convert_bits(const bytes_view_t& data,
                                    uint32_t from_bits,
                                    uint32_t to_bits,
                                    bool pad);

bool is_valid_address(const std::string_view value);

/// Lowercase spelling of a valid address; the all-uppercase form names the
/// same address. nullopt when `value` is not a valid address.
std::optional<address_t> normalize_address(const std::string_view value);

}  // namespace explorer::schema
