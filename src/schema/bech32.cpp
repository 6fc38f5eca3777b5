#include <explorer/schema/bech32.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace explorer::schema {

namespace {

constexpr auto kCharset = std::string_view{"qpzry9x8gf2tvdw0s3jn54khce6mua7l"};
constexpr auto kChecksumLength = size_t{6};
constexpr auto kMaxLength = size_t{1023};

uint32_t polymod(const bytes_view_t& values) {
  static constexpr auto kGenerator = std::array<uint32_t, 5>{
      0x3b6a57b2u, 0x26508e6du, 0x1ea119fau, 0x3d4233ddu, 0x2a1462b3u};
  auto checksum = uint32_t{1};
  for (const auto value : values) {
    auto top = checksum >> 25u;
    checksum = ((checksum & 0x1ffffffu) << 5u) ^ value;
    for (auto i = size_t{0}; i < kGenerator.size(); ++i) {
      if (((top >> i) & 1u) != 0) {
        checksum ^= kGenerator[i];
      }
    }
  }
  return checksum;
}

bytes_t expand_hrp(const std::string_view hrp) {
  auto out = bytes_t{};
  out.reserve((hrp.size() * 2) + 1);
  for (const auto ch : hrp) {
    out.push_back(static_cast<uint8_t>(static_cast<uint8_t>(ch) >> 5u));
  }
  out.push_back(0);
  for (const auto ch : hrp) {
    out.push_back(static_cast<uint8_t>(static_cast<uint8_t>(ch) & 0x1fu));
  }
  return out;
}

}  // namespace

std::optional<bech32_parts> try_decode_bech32(const std::string_view value) {
  if (value.size() > kMaxLength) {
    return std::nullopt;
  }
  auto has_lower = false;
  auto has_upper = false;
  for (const auto ch : value) {
    if (ch < 33 || ch > 126) {
      return std::nullopt;
    }
    has_lower = has_lower || (ch >= 'a' && ch <= 'z');
    has_upper = has_upper || (ch >= 'A' && ch <= 'Z');
  }
  if (has_lower && has_upper) {
    return std::nullopt;
  }

  auto separator = value.rfind('1');
  if (separator == std::string_view::npos || separator == 0 ||
      (separator + kChecksumLength + 1) > value.size()) {
    return std::nullopt;
  }

  auto parts = bech32_parts{};
  parts.hrp.reserve(separator);
  for (const auto ch : value.substr(0, separator)) {
    parts.hrp.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }

  auto words = bytes_t{};
  words.reserve(value.size() - separator - 1);
  for (const auto ch : value.substr(separator + 1)) {
    auto position = kCharset.find(
        static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (position == std::string_view::npos) {
      return std::nullopt;
    }
    words.push_back(static_cast<uint8_t>(position));
  }

  auto checked = expand_hrp(parts.hrp);
  checked.insert(std::end(checked), std::begin(words), std::end(words));
  if (polymod(checked) != 1) {
    return std::nullopt;
  }

  parts.data.assign(std::begin(words),
                    std::end(words) - static_cast<std::ptrdiff_t>(
                                          kChecksumLength));
  return parts;
}

std::string encode_bech32(const std::string_view hrp, const bytes_view_t& data) {
  auto values = expand_hrp(hrp);
  values.insert(std::end(values), std::begin(data), std::end(data));
  values.resize(values.size() + kChecksumLength, 0);
  auto checksum = polymod(values) ^ 1u;

  auto out = std::string{hrp};
  out.push_back('1');
  for (const auto word : data) {
    out.push_back(kCharset[word & 0x1fu]);
  }
  for (auto i = size_t{0}; i < kChecksumLength; ++i) {
    out.push_back(kCharset[(checksum >> (5u * (5u - i))) & 0x1fu]);
  }
  return out;
}

std::optional<bytes_t> convert_bits(const bytes_view_t& data,
                                    uint32_t from_bits,
                                    uint32_t to_bits,
                                    bool pad) {
  auto accumulator = uint32_t{};
  auto bits = uint32_t{};
  auto max_value = (1u << to_bits) - 1u;
  auto out = bytes_t{};
  for (const auto value : data) {
    if ((value >> from_bits) != 0) {
      return std::nullopt;
    }
    accumulator = (accumulator << from_bits) | value;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      out.push_back(static_cast<uint8_t>((accumulator >> bits) & max_value));
    }
  }
  if (pad) {
    if (bits > 0) {
      out.push_back(
          static_cast<uint8_t>((accumulator << (to_bits - bits)) & max_value));
    }
  } else if (bits >= from_bits ||
             ((accumulator << (to_bits - bits)) & max_value) != 0) {
    return std::nullopt;
  }
  return out;
}

bool is_valid_address(const std::string_view value) {
  auto parts = try_decode_bech32(value);
  if (!parts.has_value() || parts->data.empty()) {
    return false;
  }
  return convert_bits(parts->data, 5, 8, false).has_value();
}

std::optional<address_t> normalize_address(const std::string_view value) {
  if (!is_valid_address(value)) {
    return std::nullopt;
  }
  auto out = address_t{};
  out.reserve(value.size());
  std::transform(std::begin(value), std::end(value), std::back_inserter(out),
                 [](const char ch) {
                   return static_cast<char>(
                       std::tolower(static_cast<unsigned char>(ch)));
                 });
  return out;
}

}  // namespace explorer::schema
