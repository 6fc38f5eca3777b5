#pragma once

#include <explorer/schema/primitives.hpp>
#include <explorer/schema/query_error_code.hpp>
#include <string>

// Read API envelope returned by the path router. Mirrors the gRPC
// QueryResponse field for field.
namespace explorer::schema {

struct query_result_t final {
  query_error_code code{query_error_code::ok};
  std::string log;
  std::string info;  // the routed path
  bytes_t key;       // request data, echoed
  bytes_t value;     // SCALE encoded result when code is ok
  chain_length_t height{};  // main tip chain length at resolution time
  std::string codespace;

  bool ok() const { return code == query_error_code::ok; }
};

}  // namespace explorer::schema
