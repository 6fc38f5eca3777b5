#pragma once
#include <explorer/common/critical.hpp>
#include <explorer/schema/encoding/encoder.hpp>
#include <explorer/schema/encoding/scale/address_state.hpp>
#include <explorer/schema/encoding/scale/block.hpp>
#include <explorer/schema/encoding/scale/block_date.hpp>
#include <explorer/schema/encoding/scale/certificate.hpp>
#include <explorer/schema/encoding/scale/connection.hpp>
#include <explorer/schema/encoding/scale/leader.hpp>
#include <explorer/schema/encoding/scale/payload_type.hpp>
#include <explorer/schema/encoding/scale/settings.hpp>
#include <explorer/schema/encoding/scale/stake_pool_state.hpp>
#include <explorer/schema/encoding/scale/transaction.hpp>
#include <explorer/schema/encoding/scale/views.hpp>
#include <explorer/schema/encoding/scale/vote_plan_state.hpp>
#include <exception>
#include <iterator>
#include <utility>
#include <optional>
#include <scale/scale.hpp>
#include <spdlog/spdlog.h>

namespace explorer::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  explorer::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, explorer::schema::bytes_t& out);

  template <typename T>
  T decode(const explorer::schema::bytes_view_t& bytes);

  /// Decode without terminating: malformed input and values rejected by a
  /// record's own validation both yield std::nullopt.
  template <typename T>
  std::optional<T> try_decode(const explorer::schema::bytes_view_t& bytes);
};

template <typename T>
explorer::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    explorer::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        explorer::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const explorer::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    explorer::common::critical("failed to decode SCALE bytes");
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const explorer::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  } catch (const std::exception& ex) {
    spdlog::debug("SCALE decode rejected input: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace explorer::schema::encoding
