#include <gtest/gtest.h>
#include <explorer/index/orphan_pool.hpp>
#include <explorer/testing/chain_builder.hpp>

namespace {

using explorer::index::orphan_pool;
using explorer::testing::make_child;
using explorer::testing::make_genesis;

}  // namespace

TEST(orphan_pool, take_children_returns_arrival_order) {
  auto pool = orphan_pool{8};
  auto genesis = make_genesis();
  auto left = make_child(genesis, "left");
  auto right = make_child(genesis, "right");

  EXPECT_TRUE(pool.add(left));
  EXPECT_TRUE(pool.add(right));
  EXPECT_EQ(pool.size(), 2u);

  auto children = pool.take_children(genesis.id);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(children[0].id, left.id);
  EXPECT_EQ(children[1].id, right.id);
  EXPECT_EQ(pool.size(), 0u);
  EXPECT_FALSE(pool.contains(left.id));
  EXPECT_TRUE(pool.take_children(genesis.id).empty());
}

TEST(orphan_pool, rejects_duplicates_and_genesis) {
  auto pool = orphan_pool{8};
  auto genesis = make_genesis();
  auto child = make_child(genesis, "child");

  EXPECT_FALSE(pool.add(genesis));
  EXPECT_TRUE(pool.add(child));
  EXPECT_FALSE(pool.add(child));
  EXPECT_EQ(pool.size(), 1u);
}

TEST(orphan_pool, evicts_oldest_at_capacity) {
  auto pool = orphan_pool{2};
  auto genesis = make_genesis();
  auto first = make_child(genesis, "first");
  auto second = make_child(genesis, "second");
  auto third = make_child(first, "third");

  pool.add(first);
  pool.add(second);
  pool.add(third);

  EXPECT_EQ(pool.size(), 2u);
  EXPECT_FALSE(pool.contains(first.id));
  EXPECT_TRUE(pool.contains(second.id));
  EXPECT_TRUE(pool.contains(third.id));

  auto children = pool.take_children(genesis.id);
  ASSERT_EQ(children.size(), 1u);
  EXPECT_EQ(children[0].id, second.id);
}

TEST(orphan_pool, zero_capacity_still_buffers_one) {
  auto pool = orphan_pool{0};
  EXPECT_EQ(pool.capacity(), 1u);
  auto genesis = make_genesis();
  EXPECT_TRUE(pool.add(make_child(genesis, "only")));
  EXPECT_EQ(pool.size(), 1u);
}
