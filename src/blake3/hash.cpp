#include <blake3.h>
#include <explorer/blake3/hash.hpp>

namespace explorer::blake3 {

namespace {

explorer::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = explorer::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<explorer::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

explorer::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

explorer::schema::hash32_t hash(const explorer::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace explorer::blake3
