#pragma once
#include <explorer/schema/primitives.hpp>
#include <optional>
#include <span>

namespace explorer::schema::encoding {

// The codec is a build time choice, selected by tag. Storage, keys and the
// rpc layer are written against this interface only.
template <typename Library>
struct encoder {
  template <typename T>
  explorer::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, explorer::schema::bytes_t& out);

  template <typename T>
  T decode(const explorer::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const explorer::schema::bytes_view_t& bytes);
};

}  // namespace explorer::schema::encoding
