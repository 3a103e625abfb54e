#pragma once

#include <algorithm>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace relay_feed::async {

/// Outcome of waiting on a notifier
enum class wait_status {
  notified,///< notify() was called
  timed_out,///< The wait timeout elapsed first
  cancelled,///< The waiting coroutine or its cancellation slot was cancelled
};

/**
 * @brief One-shot wake-up shared between a producer and any number of waiting coroutines.
 *
 * Each waiter parks on its own steady_timer so that waiters can carry
 * independent timeouts. notify() is sticky: waits started afterwards complete
 * immediately.
 */
class notifier
{
public:
  /**
   * @brief Constructs a notifier.
   *
   * @param executor Executor the waiter timers run on
   */
  explicit notifier(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {}

  notifier(const notifier &) = delete;
  auto operator=(const notifier &) -> notifier & = delete;
  notifier(notifier &&) = delete;
  auto operator=(notifier &&) -> notifier & = delete;
  ~notifier() = default;

  /**
   * @brief Wakes every current waiter and marks the notifier as notified.
   */
  auto notify() -> void
  {
    if (notified_) { return; }
    notified_ = true;
    for (const auto &timer : waiters_) { timer->cancel(); }
  }

  [[nodiscard]] auto notified() const -> bool { return notified_; }

  [[nodiscard]] auto waiting() const -> std::size_t { return waiters_.size(); }

  /**
   * @brief Suspends until notified, timed out or cancelled.
   *
   * @param timeout Optional upper bound on the wait
   * @param cancel_slot Optional slot that aborts the wait when emitted
   * @return How the wait ended
   */
  [[nodiscard]] auto wait(std::optional<std::chrono::steady_clock::duration> timeout = std::nullopt,
    std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<wait_status>
  {
    if (notified_) { co_return wait_status::notified; }

    auto timer = std::make_shared<boost::asio::steady_timer>(executor_);
    if (timeout) {
      timer->expires_after(*timeout);
    } else {
      timer->expires_at(boost::asio::steady_timer::time_point::max());
    }
    waiters_.push_back(timer);

    boost::system::error_code error;
    if (cancel_slot) {
      co_await timer->async_wait(boost::asio::bind_cancellation_slot(
        *cancel_slot, boost::asio::redirect_error(boost::asio::use_awaitable, error)));
    } else {
      co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));
    }

    std::erase(waiters_, timer);

    if (notified_) { co_return wait_status::notified; }
    if (not error) { co_return wait_status::timed_out; }
    co_return wait_status::cancelled;
  }

private:
  boost::asio::any_io_executor executor_;
  std::vector<std::shared_ptr<boost::asio::steady_timer>> waiters_;
  bool notified_{ false };
};

}// namespace relay_feed::async
