#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace relay_feed::test {

template<typename T> struct spawned
{
  bool done{ false };
  std::optional<T> value;
  std::exception_ptr error;
};

template<> struct spawned<void>
{
  bool done{ false };
  std::exception_ptr error;
};

/**
 * @brief Starts a coroutine and records how it finished.
 */
template<typename T>
auto spawn(const std::shared_ptr<boost::asio::io_context> &io_context,
  boost::asio::awaitable<T> task,
  boost::asio::cancellation_slot slot = {}) -> std::shared_ptr<spawned<T>>
{
  auto result = std::make_shared<spawned<T>>();
  if constexpr (std::is_void_v<T>) {
    boost::asio::co_spawn(*io_context, std::move(task), boost::asio::bind_cancellation_slot(slot, [result](std::exception_ptr error) {
      result->done = true;
      result->error = std::move(error);
    }));
  } else {
    boost::asio::co_spawn(
      *io_context, std::move(task), boost::asio::bind_cancellation_slot(slot, [result](std::exception_ptr error, T value) {
        result->done = true;
        result->error = std::move(error);
        if (not result->error) { result->value.emplace(std::move(value)); }
      }));
  }
  return result;
}

/**
 * @brief Runs handlers until the predicate holds or the limit passes.
 *
 * @return Final value of the predicate
 */
inline auto run_until(const std::shared_ptr<boost::asio::io_context> &io_context,
  const std::function<bool()> &predicate,
  std::chrono::milliseconds limit = std::chrono::seconds(5)) -> bool
{
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (not predicate() and std::chrono::steady_clock::now() < deadline) {
    if (io_context->stopped()) { io_context->restart(); }
    io_context->run_one_for(std::chrono::milliseconds(10));
  }
  return predicate();
}

/**
 * @brief Runs a coroutine to completion and returns its result or rethrows its error.
 */
template<typename T>
auto run_coroutine(const std::shared_ptr<boost::asio::io_context> &io_context,
  boost::asio::awaitable<T> task,
  std::chrono::milliseconds limit = std::chrono::seconds(5)) -> T
{
  auto result = spawn(io_context, std::move(task));
  run_until(io_context, [&result] { return result->done; }, limit);
  if (not result->done) { throw std::runtime_error("coroutine did not finish in time"); }
  if (result->error) { std::rethrow_exception(result->error); }
  if constexpr (not std::is_void_v<T>) { return std::move(*result->value); }
}

/// Drains ready handlers without blocking
inline auto poll(const std::shared_ptr<boost::asio::io_context> &io_context) -> void
{
  if (io_context->stopped()) { io_context->restart(); }
  io_context->poll();
}

}// namespace relay_feed::test
