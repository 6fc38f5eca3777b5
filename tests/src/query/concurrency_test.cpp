#include <gtest/gtest.h>
#include <explorer/query/resolver.hpp>
#include <explorer/testing/chain_builder.hpp>
#include <explorer/testing/indexer_fixture.hpp>

#include <atomic>
#include <cstddef>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace {

using explorer::schema::applied_block_t;
using explorer::schema::pagination_arguments;
using explorer::schema::transaction_output;
using explorer::testing::indexer_fixture;
using explorer::testing::make_address;
using explorer::testing::make_child;
using explorer::testing::make_genesis;
using explorer::testing::make_hash;
using explorer::testing::make_transaction;

constexpr auto kChainLength = std::size_t{120};

std::string transaction_label(const std::size_t i) {
  return "payment-" + std::to_string(i);
}

/// Main line of `kChainLength` blocks, each paying one transaction. Every
/// fifth block gets a sibling carrying the same transaction.
std::vector<applied_block_t> make_feed() {
  auto alice = make_address("alice");
  auto feed = std::vector<applied_block_t>{make_genesis()};
  auto parent = feed.front();
  for (auto i = std::size_t{1}; i <= kChainLength; ++i) {
    auto payment = make_transaction(
        transaction_label(i), {},
        {transaction_output{.value = static_cast<explorer::schema::value_t>(i),
                            .address = alice}});
    auto block = make_child(parent, "main-" + std::to_string(i), 0, {payment});
    feed.push_back(block);
    if (i % 5 == 0) {
      feed.push_back(
          make_child(parent, "side-" + std::to_string(i), 0, {payment}));
    }
    parent = std::move(block);
  }
  return feed;
}

}  // namespace

TEST(concurrency, readers_never_see_partially_linked_blocks) {
  // Deep enough that no side branch retires while the test runs.
  auto fixture = indexer_fixture{
      "explorer_concurrency_readers",
      explorer::index::indexer_options{.epoch_stability_depth = 1000}};
  const auto& resolver = fixture.resolver();
  auto feed = make_feed();

  auto failures = std::atomic<int>{};
  auto pages = std::atomic<int>{};
  auto lookups = std::atomic<int>{};

  auto check_transactions = [&](const std::stop_token& stop) {
    auto i = std::size_t{1};
    while (!stop.stop_requested()) {
      auto transaction = resolver.transaction(make_hash(transaction_label(i)));
      if (transaction.ok()) {
        ++lookups;
        if (transaction.value->blocks.empty()) {
          ++failures;
        }
        for (const auto& id : transaction.value->blocks) {
          auto block = resolver.block(id);
          if (!block.ok() || block.value->branches.empty()) {
            ++failures;
          }
        }
      }
      i = i % kChainLength + 1;
    }
  };

  auto check_pages = [&](const std::stop_token& stop) {
    while (!stop.stop_requested()) {
      auto tip = resolver.tip();
      if (!tip.ok()) {
        continue;
      }
      auto page = resolver.branch_blocks(tip.value->id,
                                         pagination_arguments{.last = 8});
      if (!page.ok()) {
        ++failures;
        continue;
      }
      ++pages;
      const auto& edges = page.value->edges;
      auto resolved = !edges.empty();
      for (const auto& edge : edges) {
        resolved = resolved && edge.node.has_value();
      }
      if (!resolved) {
        ++failures;
        continue;
      }
      // One read view per page: positions are contiguous and end at the
      // branch tip as of that view.
      if (edges.back().node->block.chain_length + 1 !=
          page.value->total_count) {
        ++failures;
      }
      for (std::size_t k = 0; k < edges.size(); ++k) {
        if (edges[k].node->branches.empty() ||
            (k > 0 && edges[k].node->block.chain_length !=
                          edges[k - 1].node->block.chain_length + 1)) {
          ++failures;
        }
      }
    }
  };

  {
    auto transaction_reader = std::jthread{check_transactions};
    auto page_reader = std::jthread{check_pages};
    {
      auto ingestion = std::jthread{[&] {
        for (const auto& block : feed) {
          fixture.indexer().ingest(block);
        }
      }};
    }
    while (pages.load() == 0 || lookups.load() == 0) {
      std::this_thread::yield();
    }
    transaction_reader.request_stop();
    page_reader.request_stop();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_GT(pages.load(), 0);
  EXPECT_GT(lookups.load(), 0);

  auto tip = resolver.tip();
  ASSERT_TRUE(tip.ok());
  EXPECT_EQ(tip.value->chain_length, kChainLength);
  auto shared = resolver.transaction(make_hash(transaction_label(5)));
  ASSERT_TRUE(shared.ok());
  EXPECT_EQ(shared.value->blocks.size(), 2u);
}
