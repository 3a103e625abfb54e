#include <catch2/catch_test_macros.hpp>
#include <feed/feed_options.hpp>
#include <feed/pagination.hpp>
#include <nostr/protocol.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace feed = relay_feed::feed;
namespace protocol = relay_feed::nostr::protocol;

namespace {

constexpr std::uint64_t now = 1'700'000'000;
constexpr std::uint64_t day = 86'400;

auto event_at(const std::string &id, std::uint64_t created_at) -> protocol::event_data
{
  return protocol::event_data{
    .id = id, .pubkey = "alice", .created_at = created_at, .kind = protocol::kind::text_note, .tags = {}, .content = "x", .sig = ""
  };
}

auto authors(std::size_t count) -> protocol::filter
{
  protocol::filter filter;
  filter.authors = std::vector<std::string>{};
  for (std::size_t index = 0; index < count; ++index) { filter.authors->push_back("author" + std::to_string(index)); }
  return filter;
}

}// namespace

TEST_CASE("classify derives the query shape from the author count", "[feed][pagination]")
{
  CHECK(feed::classify(protocol::filter{}) == feed::query_shape::global);
  CHECK(feed::classify(authors(1)) == feed::query_shape::single_author);
  CHECK(feed::classify(authors(2)) == feed::query_shape::multi_author);
  CHECK(feed::classify(authors(10)) == feed::query_shape::multi_author);
  CHECK(feed::classify(authors(11)) == feed::query_shape::following);
  CHECK(feed::classify(authors(4), { .following_author_threshold = 3 }) == feed::query_shape::following);

  CHECK(feed::to_string(feed::query_shape::following) == "following");
}

TEST_CASE("first page windows depend on the shape", "[feed][pagination]")
{
  const feed::window_policy policy;

  const auto following = feed::first_page_window(feed::query_shape::following, policy, now);
  CHECK(following.until == now);
  CHECK(following.since == now - 7 * day);

  const auto global = feed::first_page_window(feed::query_shape::global, policy, now);
  CHECK(global.since == now - 30 * day);

  const auto early = feed::first_page_window(feed::query_shape::global, policy, 100);
  CHECK(early.since == 0);
}

TEST_CASE("next page windows slide a fixed width below the cursor", "[feed][pagination]")
{
  const feed::window_policy policy;

  const auto window = feed::next_page_window(feed::query_shape::global, now - day, policy);
  CHECK(window.until == now - day);
  CHECK(window.since == now - day - 90 * day);
  CHECK(window.until - window.since
        == static_cast<std::uint64_t>(policy.sliding_window(feed::query_shape::global).count()));

  CHECK(feed::next_page_window(feed::query_shape::global, 5, policy).since == 0);
}

TEST_CASE("sliding windows depend on the query shape", "[feed][pagination]")
{
  feed::window_policy policy;

  SECTION("following feeds cast a wider net than other shapes")
  {
    const auto following = feed::next_page_window(feed::query_shape::following, now, policy);
    CHECK(following.since == now - 180 * day);
    for (auto shape : { feed::query_shape::global, feed::query_shape::single_author, feed::query_shape::multi_author }) {
      CHECK(feed::next_page_window(shape, now, policy).since == now - 90 * day);
    }
  }

  SECTION("widths are configured separately")
  {
    policy.following_sliding_window = std::chrono::days(365);
    policy.default_sliding_window = std::chrono::days(14);
    CHECK(feed::next_page_window(feed::query_shape::following, now, policy).since == now - 365 * day);
    CHECK(feed::next_page_window(feed::query_shape::multi_author, now, policy).since == now - 14 * day);
  }
}

TEST_CASE("make_page_filter keeps the base criteria", "[feed][pagination]")
{
  auto base = authors(2);
  base.kinds = std::vector<int>{ 1 };

  const auto filter = feed::make_page_filter(base, { .since = 10, .until = 20 }, 25);
  CHECK(filter.authors == base.authors);
  CHECK(filter.kinds == base.kinds);
  CHECK(filter.since == 10U);
  CHECK(filter.until == 20U);
  CHECK(filter.limit == 25U);
  CHECK(filter.signature() == base.signature());
}

TEST_CASE("compute_cursor fallbacks", "[feed][pagination][cursor]")
{
  const std::vector<protocol::event_data> raw{ event_at("a", 500), event_at("b", 300), event_at("c", 400) };

  SECTION("oldest visible event wins")
  {
    const auto result = feed::compute_cursor(raw, 400, 1000, 1000, now);
    CHECK(result.oldest_seen == 400);
    CHECK(result.next_cursor == 399);
  }

  SECTION("oldest raw event when nothing is visible")
  {
    const auto result = feed::compute_cursor(raw, std::nullopt, 1000, 1000, now);
    CHECK(result.oldest_seen == 300);
    CHECK(result.next_cursor == 299);
  }

  SECTION("requested upper bound when the page was empty")
  {
    const auto result = feed::compute_cursor({}, std::nullopt, 1000, 1000, now);
    CHECK(result.next_cursor == 999);
  }

  SECTION("now when nothing else is known")
  {
    const auto result = feed::compute_cursor({}, std::nullopt, std::nullopt, 0, now);
    CHECK(result.next_cursor == now - 1);
  }

  SECTION("never above the queried upper bound")
  {
    const std::vector<protocol::event_data> future{ event_at("late", 5000) };
    const auto result = feed::compute_cursor(future, std::nullopt, 1000, 1000, now);
    CHECK(result.next_cursor == 999);
  }

  SECTION("floors at zero")
  {
    const std::vector<protocol::event_data> ancient{ event_at("genesis", 0) };
    CHECK(feed::compute_cursor(ancient, std::nullopt, std::nullopt, 0, now).next_cursor == 0);
  }
}

TEST_CASE("retry backoff grows and is capped", "[feed][pagination][retry]")
{
  const feed::retry_policy policy;
  CHECK(feed::backoff_delay(0, policy) == std::chrono::milliseconds(1000));
  CHECK(feed::backoff_delay(1, policy) == std::chrono::milliseconds(1500));
  CHECK(feed::backoff_delay(2, policy) == std::chrono::milliseconds(2250));
  CHECK(feed::backoff_delay(3, policy) == std::chrono::milliseconds(3000));
  CHECK(feed::backoff_delay(10, policy) == std::chrono::milliseconds(3000));

  CHECK(feed::attempts_for(feed::query_shape::following, policy) == 1);
  CHECK(feed::attempts_for(feed::query_shape::single_author, policy) == 3);
  CHECK(feed::attempts_for(feed::query_shape::multi_author, policy) == 2);
  CHECK(feed::attempts_for(feed::query_shape::global, policy) == 2);
}

TEST_CASE("query timeouts by shape and network health", "[feed][pagination][timeout]")
{
  const feed::timeout_policy policy;
  CHECK(feed::query_timeout_for(feed::query_shape::following, policy, 0) == std::chrono::milliseconds(35000));
  CHECK(feed::query_timeout_for(feed::query_shape::multi_author, policy, 0) == std::chrono::milliseconds(25000));
  CHECK(feed::query_timeout_for(feed::query_shape::single_author, policy, 0) == std::chrono::milliseconds(20000));
  CHECK(feed::query_timeout_for(feed::query_shape::global, policy, 3) == std::chrono::milliseconds(15000));
  CHECK(feed::query_timeout_for(feed::query_shape::following, policy, 4) == std::chrono::milliseconds(8000));
}

TEST_CASE("soft failed pages keep the cursor moving", "[feed][pagination]")
{
  const auto bounded = feed::soft_failed_page({ .since = 100, .until = 1000 }, now);
  CHECK(bounded.soft_failed);
  CHECK(bounded.events.empty());
  CHECK(bounded.requested_until == 1000U);
  CHECK(bounded.next_cursor == 999);

  const auto unbounded = feed::soft_failed_page({ .since = 0, .until = 0 }, now);
  CHECK_FALSE(unbounded.requested_until.has_value());
  CHECK(unbounded.next_cursor == now - 1);
}

TEST_CASE("dedupe_newest_first", "[feed][pagination]")
{
  const auto events = feed::dedupe_newest_first(
    { event_at("a", 100), event_at("b", 300), event_at("a", 200), event_at("c", 300) });

  REQUIRE(events.size() == 3);
  CHECK(events[0].id == "b");
  CHECK(events[1].id == "c");
  CHECK(events[2].id == "a");
  CHECK(events[2].created_at == 200);
}
