#pragma once

#include <async/notifier.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <memory>

namespace relay_feed::async {

/**
 * @brief Suspends the calling coroutine for a duration.
 *
 * @throws boost::system::system_error (operation_aborted) when the coroutine is cancelled
 */
inline auto sleep_for(std::chrono::steady_clock::duration duration) -> boost::asio::awaitable<void>
{
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, duration);
  co_await timer.async_wait(boost::asio::use_awaitable);
}

/**
 * @brief As sleep_for(), but also woken early by an external cancellation slot.
 *
 * @throws boost::system::system_error (operation_aborted) when cancelled
 */
inline auto sleep_for(std::chrono::steady_clock::duration duration,
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
{
  notifier never(co_await boost::asio::this_coro::executor);
  if (co_await never.wait(duration, std::move(cancel_slot)) == wait_status::cancelled) {
    throw boost::system::system_error(boost::asio::error::operation_aborted);
  }
}

}// namespace relay_feed::async
