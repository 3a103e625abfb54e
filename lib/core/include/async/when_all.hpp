#pragma once

#include <async/notifier.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <vector>

namespace relay_feed::async {

/**
 * @brief Outcome of one task in a fan-out.
 */
template<typename T> struct settled
{
  std::optional<T> value;///< Result when the task succeeded
  std::exception_ptr error;///< Captured exception when it failed

  [[nodiscard]] auto ok() const -> bool { return not error; }
};

namespace detail {

  template<typename T> struct fan_out_state
  {
    fan_out_state(const boost::asio::any_io_executor &executor, std::size_t count)
      : done(executor), results(count), finished(count, false), remaining(count)
    {
      signals.reserve(count);
      for (std::size_t i = 0; i < count; ++i) { signals.push_back(std::make_unique<boost::asio::cancellation_signal>()); }
    }

    notifier done;
    std::vector<settled<T>> results;
    std::vector<bool> finished;
    std::vector<std::unique_ptr<boost::asio::cancellation_signal>> signals;
    std::size_t remaining;
  };

}// namespace detail

/**
 * @brief Runs every task concurrently and waits for all of them to settle.
 *
 * Results keep the order of the input tasks regardless of completion order.
 * Cancelling the caller cancels every task still running.
 */
template<typename T>
auto when_all_settled(std::vector<boost::asio::awaitable<T>> tasks) -> boost::asio::awaitable<std::vector<settled<T>>>
{
  if (tasks.empty()) { co_return std::vector<settled<T>>{}; }

  auto executor = co_await boost::asio::this_coro::executor;
  auto state = std::make_shared<detail::fan_out_state<T>>(executor, tasks.size());

  for (std::size_t index = 0; index < tasks.size(); ++index) {
    boost::asio::co_spawn(executor,
      std::move(tasks[index]),
      boost::asio::bind_cancellation_slot(
        state->signals[index]->slot(), [state, index](std::exception_ptr error, T result) {
          state->finished[index] = true;
          auto &slot = state->results[index];
          if (error) {
            slot.error = std::move(error);
          } else {
            slot.value.emplace(std::move(result));
          }
          if (--state->remaining == 0) { state->done.notify(); }
        }));
  }

  if (co_await state->done.wait() != wait_status::notified) {
    for (std::size_t index = 0; index < state->signals.size(); ++index) {
      if (not state->finished[index]) { state->signals[index]->emit(boost::asio::cancellation_type::terminal); }
    }
    throw boost::system::system_error(boost::asio::error::operation_aborted);
  }

  co_return std::move(state->results);
}

}// namespace relay_feed::async
