#include <explorer/storage/rocksdb/storage.hpp>

#include <rocksdb/cache.h>
#include <rocksdb/table.h>

#include <algorithm>
#include <thread>

namespace explorer::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    std::string_view path,
    const storage_options& options) {
  auto table = ROCKSDB_NAMESPACE::BlockBasedTableOptions{};
  table.block_cache = ROCKSDB_NAMESPACE::NewLRUCache(options.block_cache_bytes);

  auto db_options = ROCKSDB_NAMESPACE::Options{};
  db_options.create_if_missing = true;
  db_options.IncreaseParallelism(
      static_cast<int>(std::max(2u, std::thread::hardware_concurrency())));
  db_options.OptimizeLevelStyleCompaction();
  db_options.table_factory.reset(
      ROCKSDB_NAMESPACE::NewBlockBasedTableFactory(table));

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  detail::check(
      ROCKSDB_NAMESPACE::DB::Open(db_options, std::string{path}, &database),
      "open of '" + std::string{path} + "'");

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  store.write_options.sync = options.sync_writes;
  spdlog::info("Opened RocksDB at {} (sync writes: {}, block cache: {} MiB)",
               path, options.sync_writes, options.block_cache_bytes >> 20u);
  return store;
}

}  // namespace explorer::storage
