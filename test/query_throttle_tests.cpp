#include <catch2/catch_test_macros.hpp>
#include <core/errors.hpp>
#include <throttle/query_throttle.hpp>
#include <throttle/throttle_config.hpp>

#include "async_test_helpers.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <vector>

namespace core = relay_feed::core;
namespace test = relay_feed::test;
namespace throttle = relay_feed::throttle;

using throttle::query_category;

namespace {

auto two_feed_slots() -> throttle::throttle_config
{
  throttle::throttle_config config;
  config.max_slots[query_category::feed] = 2;
  return config;
}

auto acquire(const std::shared_ptr<throttle::query_throttle> &throttler,
  query_category category,
  std::chrono::milliseconds queue_timeout = std::chrono::seconds(5),
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr)
  -> boost::asio::awaitable<throttle::slot_token>
{
  return throttler->acquire(category, { .cancel_slot = std::move(cancel_slot), .queue_timeout = queue_timeout });
}

}// namespace

TEST_CASE("throttle_config defaults and discovery shrink", "[throttle][config]")
{
  const throttle::throttle_config base;
  CHECK(base.max_for(query_category::feed) == 4);
  CHECK(base.max_for(query_category::metadata) == 5);
  CHECK(base.max_for(query_category::profile) == 2);
  CHECK(base.max_for(query_category::discovery) == 1);
  CHECK(base.rank(query_category::feed) < base.rank(query_category::discovery));

  const auto idle = throttle::effective_config(base, { .discovery_active = false });
  CHECK(idle.max_for(query_category::feed) == 4);

  const auto busy = throttle::effective_config(base, { .discovery_active = true });
  CHECK(busy.max_for(query_category::feed) == 1);
  CHECK(busy.max_for(query_category::metadata) == 5);
}

TEST_CASE("query category names", "[throttle][config]")
{
  for (const auto category : throttle::all_categories) {
    CHECK(throttle::parse_category(throttle::to_string(category)) == category);
  }
  CHECK_FALSE(throttle::parse_category("gossip").has_value());
}

SCENARIO("query_throttle bounds concurrent holders", "[throttle][query_throttle]")
{
  GIVEN("a feed budget of two")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto throttler = std::make_shared<throttle::query_throttle>(io_context, two_feed_slots());

    auto first = test::run_coroutine(io_context, acquire(throttler, query_category::feed));
    auto second = test::run_coroutine(io_context, acquire(throttler, query_category::feed));

    WHEN("a third request arrives")
    {
      auto third = test::spawn(io_context, acquire(throttler, query_category::feed));
      test::poll(io_context);

      THEN("it waits in the queue")
      {
        CHECK_FALSE(third->done);
        CHECK(throttler->active(query_category::feed) == 2);
        CHECK(throttler->queued(query_category::feed) == 1);
      }

      AND_WHEN("a holder releases its slot")
      {
        throttler->release(first);
        REQUIRE(test::run_until(io_context, [&] { return third->done; }));

        THEN("the waiter is admitted and the cap still holds")
        {
          REQUIRE_FALSE(third->error);
          CHECK(third->value->category == query_category::feed);
          CHECK(third->value->id != second.id);
          CHECK(throttler->active(query_category::feed) == 2);
          CHECK(throttler->queued(query_category::feed) == 0);
        }
      }
    }
  }
}

TEST_CASE("query_throttle categories do not share capacity", "[throttle][query_throttle]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto throttler = std::make_shared<throttle::query_throttle>(io_context);

  test::run_coroutine(io_context, acquire(throttler, query_category::discovery));
  auto blocked = test::spawn(io_context, acquire(throttler, query_category::discovery));
  test::poll(io_context);
  CHECK_FALSE(blocked->done);

  auto metadata = test::run_coroutine(io_context, acquire(throttler, query_category::metadata));
  CHECK(metadata.category == query_category::metadata);
  CHECK(throttler->active(query_category::metadata) == 1);
}

TEST_CASE("query_throttle serves a category in arrival order", "[throttle][query_throttle]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  throttle::throttle_config config;
  config.max_slots[query_category::profile] = 1;
  auto throttler = std::make_shared<throttle::query_throttle>(io_context, config);

  auto holder = test::run_coroutine(io_context, acquire(throttler, query_category::profile));

  std::vector<int> admitted;
  std::vector<std::shared_ptr<test::spawned<void>>> waiters;
  for (int index = 0; index < 3; ++index) {
    waiters.push_back(test::spawn(io_context,
      [](std::shared_ptr<throttle::query_throttle> throttle_ptr, int position, std::vector<int> *order)
        -> boost::asio::awaitable<void> {
        auto token = co_await acquire(throttle_ptr, query_category::profile);
        order->push_back(position);
        throttle_ptr->release(token);
      }(throttler, index, &admitted)));
    test::poll(io_context);
  }
  CHECK(throttler->queued(query_category::profile) == 3);

  throttler->release(holder);
  REQUIRE(test::run_until(io_context, [&] { return admitted.size() == 3; }));
  CHECK(admitted == std::vector<int>{ 0, 1, 2 });
}

TEST_CASE("query_throttle queue timeout", "[throttle][query_throttle]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  throttle::throttle_config config;
  config.max_slots[query_category::metadata] = 1;
  auto throttler = std::make_shared<throttle::query_throttle>(io_context, config);

  test::run_coroutine(io_context, acquire(throttler, query_category::metadata));

  CHECK_THROWS_AS(
    test::run_coroutine(io_context, acquire(throttler, query_category::metadata, std::chrono::milliseconds(20))),
    core::throttle_timeout);
  CHECK(throttler->queued(query_category::metadata) == 0);
  CHECK(throttler->active(query_category::metadata) == 1);
}

TEST_CASE("query_throttle cancellation removes the waiter", "[throttle][query_throttle]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  throttle::throttle_config config;
  config.max_slots[query_category::feed] = 1;
  auto throttler = std::make_shared<throttle::query_throttle>(io_context, config);

  auto holder = test::run_coroutine(io_context, acquire(throttler, query_category::feed));

  boost::asio::cancellation_signal signal;
  auto slot = std::make_shared<boost::asio::cancellation_slot>(signal.slot());
  auto waiter = test::spawn(io_context, acquire(throttler, query_category::feed, std::chrono::seconds(5), slot));
  test::poll(io_context);
  REQUIRE(throttler->queued(query_category::feed) == 1);

  signal.emit(boost::asio::cancellation_type::all);
  REQUIRE(test::run_until(io_context, [&] { return waiter->done; }));

  REQUIRE(waiter->error);
  CHECK_THROWS_AS(std::rethrow_exception(waiter->error), core::throttle_aborted);
  CHECK(throttler->queued(query_category::feed) == 0);

  throttler->release(holder);
  CHECK(throttler->active(query_category::feed) == 0);
}

TEST_CASE("query_throttle ignores repeated and unknown releases", "[throttle][query_throttle]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto throttler = std::make_shared<throttle::query_throttle>(io_context);

  auto first = test::run_coroutine(io_context, acquire(throttler, query_category::feed));
  auto second = test::run_coroutine(io_context, acquire(throttler, query_category::feed));
  REQUIRE(throttler->active(query_category::feed) == 2);

  throttler->release(first);
  throttler->release(first);
  throttler->release(throttle::slot_token{ .category = query_category::feed, .id = 999, .acquired_at = {} });
  CHECK(throttler->active(query_category::feed) == 1);

  throttler->release(second);
  CHECK(throttler->active(query_category::feed) == 0);
}

SCENARIO("discovery shrinks the feed budget without evicting holders", "[throttle][query_throttle]")
{
  GIVEN("three feed slots in use")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto throttler = std::make_shared<throttle::query_throttle>(io_context);
    std::vector<throttle::slot_token> held;
    for (int index = 0; index < 3; ++index) {
      held.push_back(test::run_coroutine(io_context, acquire(throttler, query_category::feed)));
    }

    WHEN("discovery starts")
    {
      throttler->set_discovery_active(true);

      THEN("held slots stay and new feed work waits")
      {
        CHECK(throttler->current_config().max_for(query_category::feed) == 1);
        CHECK(throttler->active(query_category::feed) == 3);

        auto waiter = test::spawn(io_context, acquire(throttler, query_category::feed));
        test::poll(io_context);
        CHECK_FALSE(waiter->done);

        throttler->release(held[0]);
        throttler->release(held[1]);
        test::poll(io_context);
        CHECK_FALSE(waiter->done);

        throttler->release(held[2]);
        REQUIRE(test::run_until(io_context, [&] { return waiter->done; }));
        CHECK_FALSE(waiter->error);
        CHECK(throttler->active(query_category::feed) == 1);
      }
    }

    WHEN("discovery ends while work is queued")
    {
      throttler->set_discovery_active(true);
      auto held_fourth = test::spawn(io_context, acquire(throttler, query_category::feed));
      test::poll(io_context);
      REQUIRE_FALSE(held_fourth->done);

      throttler->set_discovery_active(false);
      REQUIRE(test::run_until(io_context, [&] { return held_fourth->done; }));

      THEN("the queued request is admitted at full capacity")
      {
        CHECK_FALSE(held_fourth->error);
        CHECK(throttler->active(query_category::feed) == 4);
      }
    }
  }
}

TEST_CASE("query_throttle reset aborts waiters and frees slots", "[throttle][query_throttle]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  throttle::throttle_config config;
  config.max_slots[query_category::discovery] = 1;
  auto throttler = std::make_shared<throttle::query_throttle>(io_context, config);

  auto holder = test::run_coroutine(io_context, acquire(throttler, query_category::discovery));
  auto waiter = test::spawn(io_context, acquire(throttler, query_category::discovery));
  test::poll(io_context);

  throttler->reset();
  REQUIRE(test::run_until(io_context, [&] { return waiter->done; }));

  REQUIRE(waiter->error);
  CHECK_THROWS_AS(std::rethrow_exception(waiter->error), core::throttle_aborted);
  CHECK(throttler->active(query_category::discovery) == 0);

  throttler->release(holder);
  CHECK(throttler->active(query_category::discovery) == 0);
}

TEST_CASE("scoped_slot releases on scope exit", "[throttle][scoped_slot]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto throttler = std::make_shared<throttle::query_throttle>(io_context);

  {
    auto slot = test::run_coroutine(io_context, throttler->acquire_scoped(query_category::profile));
    CHECK(slot.held());
    CHECK(throttler->active(query_category::profile) == 1);

    throttle::scoped_slot moved = std::move(slot);
    CHECK_FALSE(slot.held());// NOLINT(bugprone-use-after-move)
    CHECK(moved.held());
    CHECK(throttler->active(query_category::profile) == 1);
  }
  CHECK(throttler->active(query_category::profile) == 0);
}

TEST_CASE("query_throttle status snapshot", "[throttle][query_throttle]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto throttler = std::make_shared<throttle::query_throttle>(io_context);
  test::run_coroutine(io_context, acquire(throttler, query_category::metadata));

  const auto status = throttler->status();
  REQUIRE(status.size() == throttle::all_categories.size());
  CHECK(status.at(query_category::metadata).active == 1);
  CHECK(status.at(query_category::metadata).max == 5);
  CHECK(status.at(query_category::feed).queued == 0);
}
