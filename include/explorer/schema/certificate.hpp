#pragma once

#include <explorer/schema/block_date.hpp>
#include <explorer/schema/payload_type.hpp>
#include <explorer/schema/primitives.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

// Schema type: certificate.
// Ledger view: the one certificate a transaction may carry. Nine variants,
// fixed when the applied block is decoded.
namespace explorer::schema {

struct tax_ratio final {
  uint64_t numerator{};
  non_zero_t denominator{1};

  bool operator==(const tax_ratio&) const = default;
};

struct tax_type final {
  value_t fixed{};
  tax_ratio ratio{};
  std::optional<non_zero_t> max_limit;

  bool operator==(const tax_type&) const = default;
};

struct pool_registration final {
  pool_id_t pool_id{};
  time_offset_seconds_t start_validity{};
  non_zero_t management_threshold{1};
  std::vector<hash32_t> owners;
  std::vector<hash32_t> operators;
  tax_type rewards{};
  std::optional<address_t> reward_account;

  bool operator==(const pool_registration&) const = default;
};

struct pool_retirement final {
  pool_id_t pool_id{};
  time_offset_seconds_t retirement_time{};

  bool operator==(const pool_retirement&) const = default;
};

struct pool_update final {
  pool_id_t pool_id{};
  pool_registration registration{};

  bool operator==(const pool_update&) const = default;
};

struct stake_delegation final {
  address_t account;
  pool_id_t pool_id{};

  bool operator==(const stake_delegation&) const = default;
};

/// Delegator is the address of the transaction's first input.
struct owner_stake_delegation final {
  pool_id_t pool_id{};

  bool operator==(const owner_stake_delegation&) const = default;
};

struct proposal_definition final {
  external_proposal_id_t external_id{};
  uint8_t options{};  // option range is [0, options)

  bool operator==(const proposal_definition&) const = default;
};

/// Proposals are addressed by a one-byte index.
inline constexpr std::size_t kMaxProposalsPerPlan{255};

struct vote_plan_certificate final {
  vote_plan_id_t vote_plan_id{};
  block_date vote_start{};
  block_date vote_end{};
  block_date committee_end{};
  payload_type_t payload_type{payload_type_t::public_payload};
  std::vector<proposal_definition> proposals;

  bool operator==(const vote_plan_certificate&) const = default;
};

struct public_vote_payload final {
  uint8_t choice{};

  bool operator==(const public_vote_payload&) const = default;
};

struct private_vote_payload final {
  bytes_t encrypted_vote;
  bytes_t proof;

  bool operator==(const private_vote_payload&) const = default;
};

using vote_payload_t = std::variant<public_vote_payload, private_vote_payload>;

/// Voter is the address of the transaction's first input.
struct vote_cast final {
  vote_plan_id_t vote_plan_id{};
  uint8_t proposal_index{};
  vote_payload_t payload{};

  bool operator==(const vote_cast&) const = default;
};

/// Plaintext results per proposal. For private plans this is the decrypted
/// tally published after the committee phase.
struct vote_tally final {
  vote_plan_id_t vote_plan_id{};
  std::vector<std::vector<weight_t>> results;

  bool operator==(const vote_tally&) const = default;
};

struct encrypted_vote_tally final {
  vote_plan_id_t vote_plan_id{};

  bool operator==(const encrypted_vote_tally&) const = default;
};

using certificate_t = std::variant<stake_delegation,
                                   owner_stake_delegation,
                                   pool_registration,
                                   pool_retirement,
                                   pool_update,
                                   vote_plan_certificate,
                                   vote_cast,
                                   vote_tally,
                                   encrypted_vote_tally>;

inline constexpr auto kCertificateNames = std::array<std::string_view, 9>{
    "stake_delegation",      "owner_stake_delegation", "pool_registration",
    "pool_retirement",       "pool_update",            "vote_plan",
    "vote_cast",             "vote_tally",             "encrypted_vote_tally"};

inline std::string_view to_string(const certificate_t& certificate) {
  return kCertificateNames[certificate.index()];
}

}  // namespace explorer::schema
