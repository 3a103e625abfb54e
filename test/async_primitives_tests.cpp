#include <catch2/catch_test_macros.hpp>
#include <async/notifier.hpp>
#include <async/sleep.hpp>
#include <async/timeout.hpp>
#include <async/when_all.hpp>
#include <core/errors.hpp>

#include "async_test_helpers.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace async = relay_feed::async;
namespace core = relay_feed::core;
namespace test = relay_feed::test;

namespace {

auto delayed_value(int value, std::chrono::milliseconds delay) -> boost::asio::awaitable<int>
{
  co_await async::sleep_for(delay);
  co_return value;
}

auto delayed_failure(std::chrono::milliseconds delay) -> boost::asio::awaitable<int>
{
  co_await async::sleep_for(delay);
  throw std::runtime_error("relay exploded");
}

}// namespace

TEST_CASE("notifier wakes waiters", "[async][notifier]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto done = std::make_shared<async::notifier>(io_context->get_executor());

  SECTION("waiters parked before notify")
  {
    auto first = test::spawn(io_context, done->wait());
    auto second = test::spawn(io_context, done->wait(std::chrono::seconds(5)));
    test::poll(io_context);
    CHECK(done->waiting() == 2);

    done->notify();
    REQUIRE(test::run_until(io_context, [&] { return first->done and second->done; }));
    CHECK(*first->value == async::wait_status::notified);
    CHECK(*second->value == async::wait_status::notified);
    CHECK(done->waiting() == 0);
  }

  SECTION("notify is sticky")
  {
    done->notify();
    CHECK(done->notified());
    CHECK(test::run_coroutine(io_context, done->wait()) == async::wait_status::notified);
  }

  SECTION("timeout")
  {
    CHECK(test::run_coroutine(io_context, done->wait(std::chrono::milliseconds(10))) == async::wait_status::timed_out);
  }

  SECTION("external cancellation")
  {
    boost::asio::cancellation_signal signal;
    auto slot = std::make_shared<boost::asio::cancellation_slot>(signal.slot());
    auto waiter = test::spawn(io_context, done->wait(std::chrono::seconds(5), slot));
    test::poll(io_context);

    signal.emit(boost::asio::cancellation_type::all);
    REQUIRE(test::run_until(io_context, [&] { return waiter->done; }));
    CHECK(*waiter->value == async::wait_status::cancelled);
  }
}

TEST_CASE("with_timeout races a task against a timer", "[async][timeout]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();

  SECTION("task finishes first")
  {
    CHECK(test::run_coroutine(io_context,
            async::with_timeout<core::query_timeout>(
              delayed_value(7, std::chrono::milliseconds(1)), std::chrono::seconds(1), std::string("slow")))
          == 7);
  }

  SECTION("timer fires first")
  {
    CHECK_THROWS_AS(test::run_coroutine(io_context,
                      async::with_timeout<core::connection_timeout>(
                        delayed_value(7, std::chrono::seconds(10)), std::chrono::milliseconds(10), std::string("wss://a"))),
      core::connection_timeout);
  }

  SECTION("task errors propagate")
  {
    CHECK_THROWS_AS(test::run_coroutine(io_context,
                      async::with_timeout<core::query_timeout>(
                        delayed_failure(std::chrono::milliseconds(1)), std::chrono::seconds(1), std::string("x"))),
      std::runtime_error);
  }

  SECTION("external cancellation aborts the wait")
  {
    boost::asio::cancellation_signal signal;
    auto slot = std::make_shared<boost::asio::cancellation_slot>(signal.slot());
    auto result = test::spawn(io_context,
      async::with_timeout_cancellable<core::query_timeout>(
        delayed_value(1, std::chrono::seconds(10)), std::chrono::seconds(5), slot, std::string("x")));
    test::poll(io_context);

    signal.emit(boost::asio::cancellation_type::all);
    REQUIRE(test::run_until(io_context, [&] { return result->done; }));
    REQUIRE(result->error);
    CHECK(core::is_cancelled(result->error));
  }
}

TEST_CASE("when_all_settled keeps input order", "[async][when_all]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();

  std::vector<boost::asio::awaitable<int>> tasks;
  tasks.push_back(delayed_value(1, std::chrono::milliseconds(30)));
  tasks.push_back(delayed_failure(std::chrono::milliseconds(1)));
  tasks.push_back(delayed_value(3, std::chrono::milliseconds(10)));

  const auto results = test::run_coroutine(io_context, async::when_all_settled(std::move(tasks)));

  REQUIRE(results.size() == 3);
  CHECK(results[0].ok());
  CHECK(*results[0].value == 1);
  CHECK_FALSE(results[1].ok());
  CHECK(core::describe(results[1].error) == "relay exploded");
  CHECK(*results[2].value == 3);
}

TEST_CASE("when_all_settled of nothing completes immediately", "[async][when_all]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  CHECK(test::run_coroutine(io_context, async::when_all_settled(std::vector<boost::asio::awaitable<int>>{})).empty());
}

TEST_CASE("sleep_for wakes early on cancellation", "[async][sleep]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  boost::asio::cancellation_signal signal;
  auto slot = std::make_shared<boost::asio::cancellation_slot>(signal.slot());

  auto sleeper = test::spawn(io_context, async::sleep_for(std::chrono::seconds(10), slot));
  test::poll(io_context);
  signal.emit(boost::asio::cancellation_type::all);

  REQUIRE(test::run_until(io_context, [&] { return sleeper->done; }, std::chrono::seconds(1)));
  REQUIRE(sleeper->error);
  CHECK(core::is_cancelled(sleeper->error));
}
