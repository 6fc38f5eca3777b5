#include <gtest/gtest.h>
#include <explorer/query/tip_channel.hpp>
#include <explorer/testing/common.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <stop_token>
#include <thread>

namespace {

using explorer::query::tip_channel;
using explorer::schema::branch_view;
using explorer::schema::chain_length_t;

branch_view make_tip(const chain_length_t chain_length) {
  return branch_view{.id = 0,
                     .tip = explorer::testing::make_hash(
                         static_cast<uint8_t>(chain_length)),
                     .chain_length = chain_length,
                     .date = {.epoch = 0, .slot = chain_length},
                     .is_main = true,
                     .is_live = true};
}

}  // namespace

TEST(tip_channel, new_subscriber_receives_latest_immediately) {
  auto channel = tip_channel{};
  auto early = channel.subscribe();
  EXPECT_FALSE(early->try_next().has_value());

  channel.publish(make_tip(3));
  auto late = channel.subscribe();
  auto tip = late->try_next();
  ASSERT_TRUE(tip.has_value());
  EXPECT_EQ(tip->chain_length, 3u);
  EXPECT_EQ(early->try_next()->chain_length, 3u);
}

TEST(tip_channel, pending_tip_is_replaced_by_newer) {
  auto channel = tip_channel{};
  auto subscription = channel.subscribe();
  channel.publish(make_tip(1));
  channel.publish(make_tip(2));
  channel.publish(make_tip(5));

  auto tip = subscription->try_next();
  ASSERT_TRUE(tip.has_value());
  EXPECT_EQ(tip->chain_length, 5u);
  EXPECT_FALSE(subscription->try_next().has_value());
}

TEST(tip_channel, chain_length_never_goes_backwards) {
  auto channel = tip_channel{};
  auto subscription = channel.subscribe();
  channel.publish(make_tip(7));
  EXPECT_EQ(subscription->try_next()->chain_length, 7u);

  channel.publish(make_tip(6));
  EXPECT_FALSE(subscription->try_next().has_value());

  // Same length, different block: a switch between equal forks.
  auto sibling = make_tip(7);
  sibling.tip = explorer::testing::make_hash("sibling");
  channel.publish(sibling);
  auto tip = subscription->try_next();
  ASSERT_TRUE(tip.has_value());
  EXPECT_EQ(tip->tip, sibling.tip);
  EXPECT_EQ(channel.latest()->tip, sibling.tip);
}

TEST(tip_channel, notify_runs_on_every_accepted_offer) {
  auto channel = tip_channel{};
  auto calls = std::atomic<int>{};
  auto subscription = channel.subscribe([&] { ++calls; });
  channel.publish(make_tip(1));
  channel.publish(make_tip(2));
  EXPECT_EQ(calls.load(), 2);

  subscription->set_notify({});
  channel.publish(make_tip(3));
  EXPECT_EQ(calls.load(), 2);
}

TEST(tip_channel, dropped_subscribers_are_pruned) {
  auto channel = tip_channel{};
  auto kept = channel.subscribe();
  {
    auto dropped = channel.subscribe();
    EXPECT_EQ(channel.subscriber_count(), 2u);
  }
  channel.publish(make_tip(1));
  EXPECT_EQ(channel.subscriber_count(), 1u);
}

TEST(tip_channel, wait_next_wakes_on_publish_and_on_stop) {
  auto channel = tip_channel{};
  auto subscription = channel.subscribe();

  auto received = std::optional<branch_view>{};
  auto waiter = std::jthread{[&](std::stop_token) {
    received = subscription->wait_next(std::stop_token{});
  }};
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.publish(make_tip(4));
  waiter.join();
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->chain_length, 4u);

  auto source = std::stop_source{};
  auto stopped = std::jthread{[&](std::stop_token) {
    received = subscription->wait_next(source.get_token());
  }};
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  source.request_stop();
  stopped.join();
  EXPECT_FALSE(received.has_value());
}
