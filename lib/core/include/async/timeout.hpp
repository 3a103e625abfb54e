#pragma once

#include <async/notifier.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>

namespace relay_feed::async {

namespace detail {

  template<typename T> struct task_state
  {
    explicit task_state(const boost::asio::any_io_executor &executor) : done(executor) {}

    notifier done;
    boost::asio::cancellation_signal cancel;
    std::optional<T> value;
    std::exception_ptr error;

    auto complete(std::exception_ptr err, T result) -> void
    {
      if (err) {
        error = std::move(err);
      } else {
        value.emplace(std::move(result));
      }
      done.notify();
    }

    auto take() -> T
    {
      if (error) { std::rethrow_exception(error); }
      return std::move(*value);
    }
  };

  template<> struct task_state<void>
  {
    explicit task_state(const boost::asio::any_io_executor &executor) : done(executor) {}

    notifier done;
    boost::asio::cancellation_signal cancel;
    std::exception_ptr error;

    auto complete(std::exception_ptr err) -> void
    {
      error = std::move(err);
      done.notify();
    }

    auto take() -> void
    {
      if (error) { std::rethrow_exception(error); }
    }
  };

}// namespace detail

/**
 * @brief Races a task against a timer.
 *
 * The task runs as a child coroutine bound to a private cancellation signal.
 * When the timer wins, the child is cancelled and its late result is
 * discarded, so it can never be applied by the caller.
 *
 * @tparam TimeoutError Exception thrown on expiry, constructed from error_args
 * @param task Work to run
 * @param timeout Upper bound for the task
 * @param cancel_slot Optional slot that abandons the task when emitted
 * @param error_args Constructor arguments for TimeoutError
 * @return The task's result
 * @throws TimeoutError when the timeout elapses first
 * @throws boost::system::system_error (operation_aborted) when the caller is cancelled
 */
template<typename TimeoutError, typename T, typename... Args>
auto with_timeout_cancellable(boost::asio::awaitable<T> task,
  std::chrono::steady_clock::duration timeout,
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot,
  Args... error_args) -> boost::asio::awaitable<T>
{
  auto executor = co_await boost::asio::this_coro::executor;
  auto state = std::make_shared<detail::task_state<T>>(executor);

  if constexpr (std::is_void_v<T>) {
    boost::asio::co_spawn(executor,
      std::move(task),
      boost::asio::bind_cancellation_slot(
        state->cancel.slot(), [state](std::exception_ptr error) { state->complete(std::move(error)); }));
  } else {
    boost::asio::co_spawn(executor,
      std::move(task),
      boost::asio::bind_cancellation_slot(state->cancel.slot(), [state](std::exception_ptr error, T result) {
        state->complete(std::move(error), std::move(result));
      }));
  }

  const auto status = co_await state->done.wait(timeout, std::move(cancel_slot));

  if (status == wait_status::notified) {
    if constexpr (std::is_void_v<T>) {
      state->take();
      co_return;
    } else {
      co_return state->take();
    }
  }

  state->cancel.emit(boost::asio::cancellation_type::terminal);

  if (status == wait_status::timed_out) { throw TimeoutError(std::move(error_args)...); }
  throw boost::system::system_error(boost::asio::error::operation_aborted);
}

/// with_timeout_cancellable() without an external cancellation slot
template<typename TimeoutError, typename T, typename... Args>
auto with_timeout(boost::asio::awaitable<T> task, std::chrono::steady_clock::duration timeout, Args... error_args)
  -> boost::asio::awaitable<T>
{
  return with_timeout_cancellable<TimeoutError>(std::move(task), timeout, nullptr, std::move(error_args)...);
}

}// namespace relay_feed::async
