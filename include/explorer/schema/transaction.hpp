#pragma once

#include <explorer/schema/certificate.hpp>
#include <explorer/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: transaction.
// Ledger view: decoded transaction content as delivered by the ledger feed.
// Stored once, keyed by id, shared by every block that contains it.
namespace explorer::schema {

struct transaction_input final {
  value_t value{};
  address_t address;

  bool operator==(const transaction_input&) const = default;
};

struct transaction_output final {
  value_t value{};
  address_t address;

  bool operator==(const transaction_output&) const = default;
};

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  transaction_id_t id{};
  std::vector<transaction_input> inputs;
  std::vector<transaction_output> outputs;
  std::optional<certificate_t> certificate;

  bool operator==(const transaction<1>&) const = default;
};

using transaction_t = transaction<1>;

}  // namespace explorer::schema
