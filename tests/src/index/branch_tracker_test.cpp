#include <gtest/gtest.h>
#include <explorer/index/block_dag.hpp>
#include <explorer/index/branch_tracker.hpp>
#include <explorer/testing/common.hpp>

#include <optional>
#include <vector>

namespace {

using explorer::index::block_dag;
using explorer::index::branch_tracker;
using explorer::index::kNoSlot;
using explorer::index::slot_t;
using explorer::schema::block_t;
using explorer::schema::branch_id_t;
using explorer::schema::chain_length_t;
using explorer::testing::make_hash;

class tracked_dag final {
 public:
  tracked_dag(const uint32_t depth, const uint32_t retention)
      : tracker_{dag_, depth, retention} {}

  tracked_dag(const tracked_dag&) = delete;
  tracked_dag& operator=(const tracked_dag&) = delete;

  explorer::index::tip_update add(const uint8_t seed,
                                  const std::optional<uint8_t> parent,
                                  const uint64_t score = 0) {
    auto block = block_t{};
    block.id = make_hash(seed);
    if (parent.has_value()) {
      block.parent_id = make_hash(*parent);
      block.chain_length = dag_.node(*dag_.find(make_hash(*parent))).chain_length + 1;
    }
    block.score = score;
    auto linked = dag_.ingest(block);
    EXPECT_EQ(linked.status, explorer::index::link_status::linked);
    auto update = tracker_.on_linked(linked.slot);
    if (update.excluded) {
      dag_.exclude_subtree(linked.slot);
    }
    return update;
  }

  slot_t slot(const uint8_t seed) const { return *dag_.find(make_hash(seed)); }
  block_dag& dag() { return dag_; }
  branch_tracker& tracker() { return tracker_; }

 private:
  block_dag dag_;
  branch_tracker tracker_;
};

}  // namespace

TEST(branch_tracker, extending_a_tip_keeps_the_branch) {
  auto chain = tracked_dag{10, 10};
  auto genesis = chain.add(0, std::nullopt);
  auto next = chain.add(1, 0);

  EXPECT_EQ(genesis.branch, next.branch);
  EXPECT_TRUE(genesis.main_changed);
  EXPECT_FALSE(next.main_changed);
  ASSERT_TRUE(chain.tracker().main().has_value());
  EXPECT_EQ(chain.tracker().main()->tip, chain.slot(1));
  EXPECT_EQ(chain.tracker().live_branches().size(), 1u);
}

TEST(branch_tracker, heavier_fork_becomes_main) {
  auto chain = tracked_dag{10, 10};
  chain.add(0, std::nullopt);
  chain.add(1, 0);
  auto original = chain.add(2, 1, 5);
  auto fork = chain.add(3, 1, 7);

  ASSERT_TRUE(original.branch.has_value());
  ASSERT_TRUE(fork.branch.has_value());
  EXPECT_NE(*original.branch, *fork.branch);
  EXPECT_TRUE(fork.main_changed);
  EXPECT_EQ(chain.tracker().main()->id, *fork.branch);
  EXPECT_EQ(chain.tracker().live_branches().size(), 2u);

  auto both = chain.tracker().branches_containing(chain.slot(1));
  EXPECT_EQ(both.size(), 2u);
  auto only_fork = chain.tracker().branches_containing(chain.slot(3));
  EXPECT_EQ(only_fork, (std::vector<branch_id_t>{*fork.branch}));
}

TEST(branch_tracker, equal_order_keeps_incumbent_main) {
  auto chain = tracked_dag{10, 10};
  chain.add(0, std::nullopt);
  auto first = chain.add(1, 0, 3);
  auto second = chain.add(2, 0, 3);
  EXPECT_FALSE(second.main_changed);
  EXPECT_EQ(chain.tracker().main()->id, *first.branch);
}

TEST(branch_tracker, stale_fork_is_retired_but_resolvable) {
  auto chain = tracked_dag{10, 2};
  chain.add(0, std::nullopt);
  auto fork = chain.add(50, 0);
  chain.add(1, 0, 1);
  chain.add(2, 1);
  chain.add(3, 2);
  auto update = chain.add(4, 3);

  EXPECT_EQ(update.retired, (std::vector<branch_id_t>{*fork.branch}));
  EXPECT_EQ(chain.tracker().live_branches().size(), 1u);
  auto retired = chain.tracker().find(*fork.branch);
  ASSERT_TRUE(retired.has_value());
  EXPECT_FALSE(retired->live);
}

TEST(branch_tracker, confirmation_follows_stability_depth) {
  auto chain = tracked_dag{2, 10};
  chain.add(0, std::nullopt);
  chain.add(1, 0);
  EXPECT_FALSE(chain.tracker().is_confirmed(chain.slot(0)));

  chain.add(2, 1);
  EXPECT_TRUE(chain.tracker().is_confirmed(chain.slot(0)));
  EXPECT_FALSE(chain.tracker().is_confirmed(chain.slot(1)));

  auto watermark_length = chain_length_t{};
  for (auto seed = uint8_t{3}; seed < 10; ++seed) {
    chain.add(seed, static_cast<uint8_t>(seed - 1));
    auto length =
        chain.dag().node(chain.tracker().confirmed_watermark()).chain_length;
    EXPECT_GE(length, watermark_length);
    watermark_length = length;
  }
  EXPECT_EQ(watermark_length, 7u);
  EXPECT_TRUE(chain.tracker().is_confirmed(chain.slot(7)));
  EXPECT_FALSE(chain.tracker().is_confirmed(chain.slot(8)));
}

TEST(branch_tracker, block_below_watermark_fork_is_excluded) {
  auto chain = tracked_dag{1, 10};
  chain.add(0, std::nullopt);
  chain.add(1, 0);
  chain.add(2, 1);
  chain.add(3, 2);
  ASSERT_NE(chain.tracker().confirmed_watermark(), kNoSlot);
  ASSERT_TRUE(chain.tracker().is_confirmed(chain.slot(2)));

  auto branches_before = chain.tracker().live_branches().size();
  auto update = chain.add(60, 1);
  EXPECT_TRUE(update.excluded);
  EXPECT_FALSE(update.branch.has_value());
  EXPECT_EQ(chain.tracker().live_branches().size(), branches_before);

  auto descendant = chain.add(61, 60);
  EXPECT_TRUE(descendant.excluded);
  EXPECT_TRUE(chain.tracker().branches_containing(chain.slot(60)).empty());
}
