#pragma once

#include <explorer/schema/views.hpp>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace explorer::query {

/// One subscriber slot. Holds only the latest undelivered tip; a newer tip
/// replaces an older pending one. Never yields a chain length lower than the
/// last tip it yielded.
class tip_subscription final {
 public:
  using notify_t = std::function<void()>;

  void offer(const explorer::schema::branch_view& tip);

  /// Block until a tip is pending or `stop` is requested.
  std::optional<explorer::schema::branch_view> wait_next(
      const std::stop_token& stop);
  std::optional<explorer::schema::branch_view> try_next();

  /// Called after every accepted offer. Once set_notify returns, the previous
  /// callback is no longer running.
  void set_notify(notify_t notify);

 private:
  std::mutex mutex_;
  std::condition_variable_any ready_;
  std::optional<explorer::schema::branch_view> pending_;
  std::optional<explorer::schema::chain_length_t> last_emitted_;
  std::mutex notify_mutex_;
  notify_t notify_;
};

/// Latest-value broadcast of the main branch tip.
class tip_channel final {
 public:
  /// New subscribers receive the current tip immediately.
  std::shared_ptr<tip_subscription> subscribe(
      tip_subscription::notify_t notify = {});

  void publish(const explorer::schema::branch_view& tip);

  std::optional<explorer::schema::branch_view> latest() const;
  std::size_t subscriber_count() const;

 private:
  mutable std::mutex mutex_;
  std::optional<explorer::schema::branch_view> latest_;
  mutable std::vector<std::weak_ptr<tip_subscription>> subscribers_;
};

}  // namespace explorer::query
