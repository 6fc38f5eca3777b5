#include <explorer/query/tip_channel.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace explorer::query {

using namespace explorer::schema;

void tip_subscription::offer(const branch_view& tip) {
  {
    auto lock = std::scoped_lock{mutex_};
    auto floor = last_emitted_;
    if (pending_.has_value()) {
      floor = std::max(floor.value_or(0), pending_->chain_length);
    }
    if (floor.has_value() && tip.chain_length < *floor) {
      spdlog::debug("Dropping tip at chain length {} below {}",
                    tip.chain_length, *floor);
      return;
    }
    pending_ = tip;
  }
  ready_.notify_all();

  auto lock = std::scoped_lock{notify_mutex_};
  if (notify_) {
    notify_();
  }
}

std::optional<branch_view> tip_subscription::wait_next(
    const std::stop_token& stop) {
  auto lock = std::unique_lock{mutex_};
  if (!ready_.wait(lock, stop, [&] { return pending_.has_value(); })) {
    return std::nullopt;
  }
  auto tip = std::move(*pending_);
  pending_.reset();
  last_emitted_ = tip.chain_length;
  return tip;
}

std::optional<branch_view> tip_subscription::try_next() {
  auto lock = std::scoped_lock{mutex_};
  if (!pending_.has_value()) {
    return std::nullopt;
  }
  auto tip = std::move(*pending_);
  pending_.reset();
  last_emitted_ = tip.chain_length;
  return tip;
}

void tip_subscription::set_notify(notify_t notify) {
  auto lock = std::scoped_lock{notify_mutex_};
  notify_ = std::move(notify);
}

std::shared_ptr<tip_subscription> tip_channel::subscribe(
    tip_subscription::notify_t notify) {
  auto subscription = std::make_shared<tip_subscription>();
  subscription->set_notify(std::move(notify));

  auto lock = std::scoped_lock{mutex_};
  subscribers_.push_back(subscription);
  if (latest_.has_value()) {
    subscription->offer(*latest_);
  }
  return subscription;
}

void tip_channel::publish(const branch_view& tip) {
  auto lock = std::scoped_lock{mutex_};
  latest_ = tip;
  std::erase_if(subscribers_,
                [](const auto& subscriber) { return subscriber.expired(); });
  for (const auto& subscriber : subscribers_) {
    if (auto live = subscriber.lock()) {
      live->offer(tip);
    }
  }
  spdlog::debug("Published tip {} at chain length {} to {} subscriber(s)",
                to_hex(tip.tip), tip.chain_length, subscribers_.size());
}

std::optional<branch_view> tip_channel::latest() const {
  auto lock = std::scoped_lock{mutex_};
  return latest_;
}

std::size_t tip_channel::subscriber_count() const {
  auto lock = std::scoped_lock{mutex_};
  std::erase_if(subscribers_,
                [](const auto& subscriber) { return subscriber.expired(); });
  return subscribers_.size();
}

}  // namespace explorer::query
