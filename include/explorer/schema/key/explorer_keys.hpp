#pragma once

#include <algorithm>
#include <array>
#include <boost/endian/buffers.hpp>
#include <explorer/schema/primitives.hpp>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: explorer keys.
// Ledger view: canonical key prefixes for stored entities and the ingestion
// log that recovery replays.
namespace explorer::schema::key {

inline constexpr std::string_view kBlockKeyPrefix{"EXP|BLOCK|"};
inline constexpr std::string_view kTransactionKeyPrefix{"EXP|TX|"};
inline constexpr std::string_view kStakePoolKeyPrefix{"EXP|POOL|"};
inline constexpr std::string_view kVotePlanKeyPrefix{"EXP|VOTE_PLAN|"};
inline constexpr std::string_view kVoteKeyPrefix{"EXP|VOTE|"};
inline constexpr std::string_view kAddressKeyPrefix{"EXP|ADDRESS|"};
inline constexpr std::string_view kIngestLogPrefix{"EXP|LOG|"};
inline constexpr std::string_view kAppliedKeyPrefix{"EXP|APPLIED|"};

inline const std::array<std::string_view, 8> kExplorerKeyspaces{
    kBlockKeyPrefix,    kTransactionKeyPrefix, kStakePoolKeyPrefix,
    kVotePlanKeyPrefix, kVoteKeyPrefix,        kAddressKeyPrefix,
    kIngestLogPrefix,   kAppliedKeyPrefix};

template <typename Encoder, typename T>
explorer::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
explorer::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
explorer::schema::bytes_t make_block_key(
    Encoder& encoder,
    const explorer::schema::block_id_t& id) {
  return make_prefixed_key(encoder, kBlockKeyPrefix, id);
}

template <typename Encoder>
explorer::schema::bytes_t make_transaction_key(
    Encoder& encoder,
    const explorer::schema::transaction_id_t& id) {
  return make_prefixed_key(encoder, kTransactionKeyPrefix, id);
}

template <typename Encoder>
explorer::schema::bytes_t make_stake_pool_key(
    Encoder& encoder,
    const explorer::schema::pool_id_t& id) {
  return make_prefixed_key(encoder, kStakePoolKeyPrefix, id);
}

template <typename Encoder>
explorer::schema::bytes_t make_vote_plan_key(
    Encoder& encoder,
    const explorer::schema::vote_plan_id_t& id) {
  return make_prefixed_key(encoder, kVotePlanKeyPrefix, id);
}

template <typename Encoder>
explorer::schema::bytes_t make_vote_key(
    Encoder& encoder,
    const explorer::schema::vote_plan_id_t& plan,
    const uint8_t proposal_index,
    const uint64_t vote_index) {
  return make_prefixed_key(encoder, kVoteKeyPrefix,
                           std::tuple{plan, proposal_index, vote_index});
}

template <typename Encoder>
explorer::schema::bytes_t make_address_key(
    Encoder& encoder,
    const explorer::schema::address_t& address) {
  return make_prefixed_key(encoder, kAddressKeyPrefix, address);
}

/// Sequence keys carry the sequence big-endian so that a prefix scan
/// returns entries in ingestion order.
template <typename Encoder>
explorer::schema::bytes_t make_sequence_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const uint64_t sequence) {
  auto key = make_prefix_key(encoder, prefix);
  auto buffer = boost::endian::big_uint64_buf_t{sequence};
  key.insert(std::end(key), buffer.data(), buffer.data() + sizeof(sequence));
  return key;
}

template <typename Encoder>
explorer::schema::bytes_t make_ingest_log_key(Encoder& encoder,
                                              const uint64_t sequence) {
  return make_sequence_key(encoder, kIngestLogPrefix, sequence);
}

/// Present once the aggregates of an ingestion log entry are committed.
template <typename Encoder>
explorer::schema::bytes_t make_applied_marker_key(Encoder& encoder,
                                                  const uint64_t sequence) {
  return make_sequence_key(encoder, kAppliedKeyPrefix, sequence);
}

template <typename Encoder>
std::optional<uint64_t> parse_ingest_log_key(
    Encoder& encoder,
    const explorer::schema::bytes_view_t& key) {
  auto prefix = make_prefix_key(encoder, kIngestLogPrefix);
  if (key.size() != prefix.size() + sizeof(uint64_t) ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::copy_n(std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()),
              sizeof(uint64_t), reinterpret_cast<uint8_t*>(buffer.data()));
  return buffer.value();
}

}  // namespace explorer::schema::key
