#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <explorer/common/critical.hpp>
#include <explorer/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace explorer::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const explorer::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline explorer::schema::bytes_view_t to_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return explorer::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

/// Smallest key greater than every key starting with `prefix`, or nullopt
/// when the prefix is all 0xFF bytes.
inline std::optional<std::string> prefix_successor(
    const explorer::schema::bytes_view_t& prefix) {
  auto bound = std::string{reinterpret_cast<const char*>(prefix.data()),
                           prefix.size()};
  while (!bound.empty()) {
    auto& last = reinterpret_cast<unsigned char&>(bound.back());
    if (last != 0xFF) {
      ++last;
      return bound;
    }
    bound.pop_back();
  }
  return std::nullopt;
}

inline void check(const ROCKSDB_NAMESPACE::Status& status,
                  const std::string_view operation) {
  if (!status.ok()) {
    spdlog::critical("RocksDB {} failed: {}", operation, status.ToString());
    explorer::common::critical("RocksDB " + std::string{operation} +
                               " failed");
  }
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  ROCKSDB_NAMESPACE::WriteOptions write_options;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const explorer::schema::bytes_view_t& key) const;

  void write_batch(const std::vector<key_value_entry_t>& entries) const;

  template <typename Visitor>
  void scan_prefix(const explorer::schema::bytes_view_t& prefix,
                   Visitor&& visit) const;

 private:
  ROCKSDB_NAMESPACE::DB& db() const {
    if (!database) {
      explorer::common::critical("RocksDB database is not open");
    }
    return *database;
  }
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    std::string_view path,
    const storage_options& options);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const explorer::schema::bytes_view_t& key) const {
  auto& database = db();
  auto value = ROCKSDB_NAMESPACE::PinnableSlice{};
  auto status = database.Get(ROCKSDB_NAMESPACE::ReadOptions{},
                             database.DefaultColumnFamily(),
                             detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::check(status, "get");

  auto decoded = encoder.template try_decode<T>(detail::to_view(value));
  if (!decoded.has_value()) {
    throw explorer::common::internal_consistency_error{
        "stored record failed to decode under key " +
        explorer::schema::to_hex(key)};
  }
  return decoded;
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    detail::check(batch.Put(detail::to_slice(key), detail::to_slice(value)),
                  "batch staging");
  }
  detail::check(db().Write(write_options, &batch), "batch write");
}

template <typename Visitor>
void storage<rocksdb_storage_tag>::scan_prefix(
    const explorer::schema::bytes_view_t& prefix,
    Visitor&& visit) const {
  // The bound slice must outlive the iterator.
  auto upper = detail::prefix_successor(prefix);
  auto upper_slice = ROCKSDB_NAMESPACE::Slice{};
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  if (upper.has_value()) {
    upper_slice = ROCKSDB_NAMESPACE::Slice{*upper};
    read_options.iterate_upper_bound = &upper_slice;
  }

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      db().NewIterator(read_options)};
  for (iterator->Seek(detail::to_slice(prefix)); iterator->Valid();
       iterator->Next()) {
    if (!visit(detail::to_view(iterator->key()),
               detail::to_view(iterator->value()))) {
      break;
    }
  }
  detail::check(iterator->status(), "prefix scan");
}

}  // namespace explorer::storage
