#pragma once

#include <explorer/index/indexer.hpp>
#include <explorer/query/resolver.hpp>
#include <explorer/query/tip_channel.hpp>
#include <explorer/schema/settings.hpp>
#include <explorer/storage/entity_store.hpp>
#include <explorer/testing/chain_builder.hpp>
#include <explorer/testing/common.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace explorer::testing {

/// Store, indexer, resolver and tip channel over a scratch database.
class indexer_fixture final {
 public:
  explicit indexer_fixture(const std::string_view db_prefix,
                           explorer::index::indexer_options options = {},
                           const uint64_t max_page_size = 100)
      : db_path_{make_db_path(db_prefix)},
        options_{std::move(options)},
        max_page_size_{max_page_size} {
    open();
  }

  indexer_fixture(const indexer_fixture&) = delete;
  indexer_fixture& operator=(const indexer_fixture&) = delete;
  indexer_fixture(indexer_fixture&&) = delete;
  indexer_fixture& operator=(indexer_fixture&&) = delete;

  ~indexer_fixture() {
    close();
    remove_path(db_path_);
  }

  /// Drop every in-memory structure and rebuild it from the database.
  void reopen() {
    close();
    open();
  }

  explorer::schema::ingest_status_t ingest(
      const explorer::schema::applied_block_t& block) {
    return indexer_->ingest(block).status;
  }

  void ingest_all(const std::vector<explorer::schema::applied_block_t>& blocks) {
    for (const auto& block : blocks) {
      indexer_->ingest(block);
    }
  }

  const std::string& db_path() const { return db_path_; }
  explorer::storage::entity_store& store() { return *store_; }
  explorer::index::indexer& indexer() { return *indexer_; }
  const explorer::query::resolver& resolver() const { return *resolver_; }
  explorer::query::tip_channel& tips() { return *tips_; }

 private:
  void open() {
    store_ = std::make_unique<explorer::storage::entity_store>(db_path_);
    indexer_ = std::make_unique<explorer::index::indexer>(*store_, options_);
    tips_ = std::make_unique<explorer::query::tip_channel>();
    auto* tips = tips_.get();
    indexer_->set_tip_listener(
        [tips](const explorer::schema::branch_view& tip) { tips->publish(tip); });
    indexer_->recover();
    resolver_ = std::make_unique<explorer::query::resolver>(
        *indexer_,
        explorer::schema::settings_t{
            .fees = {}, .epoch_stability_depth = options_.epoch_stability_depth},
        max_page_size_);
  }

  void close() {
    resolver_.reset();
    indexer_.reset();
    tips_.reset();
    store_.reset();
  }

  std::string db_path_;
  explorer::index::indexer_options options_;
  uint64_t max_page_size_;
  std::unique_ptr<explorer::storage::entity_store> store_;
  std::unique_ptr<explorer::index::indexer> indexer_;
  std::unique_ptr<explorer::query::tip_channel> tips_;
  std::unique_ptr<explorer::query::resolver> resolver_;
};

}  // namespace explorer::testing
