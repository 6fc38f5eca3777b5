#include <explorer/common/critical.hpp>
#include <explorer/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace explorer::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
constexpr auto kInvalid = uint8_t{0xFF};

/// Reverse lookup for kBase64Alphabet; kInvalid marks characters outside it.
constexpr std::array<uint8_t, 256> make_base64_table() {
  auto table = std::array<uint8_t, 256>{};
  table.fill(kInvalid);
  for (auto i = std::size_t{0}; i < kBase64Alphabet.size(); ++i) {
    table[static_cast<uint8_t>(kBase64Alphabet[i])] = static_cast<uint8_t>(i);
  }
  return table;
}

constexpr auto kBase64Table = make_base64_table();

int hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower >= 'a' && lower <= 'f') {
    return lower - 'a' + 10;
  }
  return -1;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t(std::begin(bytes), std::end(bytes));
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return make_bytes_view(std::string_view{bytes});
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string make_string(const bytes_t& bytes) {
  return make_string(make_bytes_view(bytes));
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

std::optional<hash32_t> try_make_hash32(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value() || decoded->size() != std::tuple_size_v<hash32_t>) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy_n(std::begin(*decoded), hash.size(), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view hex) {
  auto hash = try_make_hash32(hex);
  if (!hash.has_value()) {
    explorer::common::critical("expected a 64 character hex hash, got '" +
                               std::string{hex} + "'");
  }
  return *hash;
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  auto out = bytes_t{};
  out.reserve(hex.size() / 2);
  for (auto i = std::size_t{0}; i < hex.size(); i += 2) {
    auto high = hex_value(hex[i]);
    auto low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return out;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    explorer::common::critical("invalid hex input");
  }
  return std::move(*decoded);
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (auto i = std::size_t{0}; i < bytes.size(); i += 3) {
    auto remaining = std::min<std::size_t>(3, bytes.size() - i);
    auto group = uint32_t{bytes[i]} << 16u;
    if (remaining > 1) {
      group |= uint32_t{bytes[i + 1]} << 8u;
    }
    if (remaining > 2) {
      group |= uint32_t{bytes[i + 2]};
    }
    // n input bytes produce n + 1 characters, padded to four.
    for (auto c = std::size_t{0}; c < 4; ++c) {
      if (c <= remaining) {
        out.push_back(kBase64Alphabet[(group >> (18u - 6u * c)) & 0x3Fu]);
      } else {
        out.push_back('=');
      }
    }
  }
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(make_bytes_view(bytes));
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::copy_if(std::begin(encoded), std::end(encoded),
               std::back_inserter(compact), [](const char c) {
                 return std::isspace(static_cast<unsigned char>(c)) == 0;
               });
  if (compact.size() % 4 != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (auto i = std::size_t{0}; i < compact.size(); i += 4) {
    auto last_group = i + 4 == compact.size();
    auto padding = std::size_t{0};
    auto group = uint32_t{};
    for (auto c = std::size_t{0}; c < 4; ++c) {
      auto ch = compact[i + c];
      if (ch == '=') {
        // Padding only in the last two positions of the final group.
        if (!last_group || c < 2) {
          return std::nullopt;
        }
        ++padding;
        group <<= 6u;
        continue;
      }
      auto value = kBase64Table[static_cast<uint8_t>(ch)];
      if (value == kInvalid || padding > 0) {
        return std::nullopt;
      }
      group = (group << 6u) | value;
    }
    out.push_back(static_cast<uint8_t>(group >> 16u));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>(group >> 8u));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(group));
    }
  }
  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    explorer::common::critical("invalid base64 input");
  }
  return std::move(*decoded);
}

}  // namespace explorer::schema
