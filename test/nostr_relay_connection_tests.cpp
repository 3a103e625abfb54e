#include <catch2/catch_test_macros.hpp>
#include <core/errors.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_connection.hpp>

#include "async_test_helpers.hpp"
#include "test_doubles/test_double_websocket_stream.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace nostr = relay_feed::nostr;
namespace core = relay_feed::core;
namespace test = relay_feed::test;

namespace {

using connection_t = nostr::relay_connection<test::test_double_websocket_stream>;

auto make_event(const std::string &id, std::uint64_t created_at) -> nostr::protocol::event_data
{
  return nostr::protocol::event_data{ .id = id,
    .pubkey = "alice",
    .created_at = created_at,
    .kind = nostr::protocol::kind::text_note,
    .tags = {},
    .content = "note " + id,
    .sig = "sig" };
}

auto event_frame(const std::string &subscription_id, const nostr::protocol::event_data &event) -> std::string
{
  return nostr::protocol::event{ .subscription_id = subscription_id, .data = event }.serialize();
}

auto eose_frame(const std::string &subscription_id) -> std::string
{
  return nlohmann::json::array({ "EOSE", subscription_id }).dump();
}

/// Answers every REQ with the given events followed by EOSE
auto serve_events(std::vector<nostr::protocol::event_data> events) -> test::test_double_websocket_stream::responder_t
{
  return [events = std::move(events)](const std::string &written) -> std::vector<std::string> {
    auto request = nostr::protocol::req::deserialize(written);
    if (not request) { return {}; }
    std::vector<std::string> replies;
    for (const auto &event : events) { replies.push_back(event_frame(request->subscription_id, event)); }
    replies.push_back(eose_frame(request->subscription_id));
    return replies;
  };
}

struct connection_fixture
{
  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<test::test_double_websocket_stream> stream =
    std::make_shared<test::test_double_websocket_stream>(io_context);
  std::shared_ptr<connection_t> connection =
    std::make_shared<connection_t>("wss://relay.example.com", stream, io_context);

  auto connect() -> void { test::run_coroutine(io_context, connection->async_connect()); }
};

}// namespace

TEST_CASE("relay_connection connects to the parsed endpoint", "[nostr][relay_connection]")
{
  connection_fixture fixture;
  fixture.connect();

  CHECK(fixture.connection->is_open());
  REQUIRE(fixture.stream->get_connections().size() == 1);
  CHECK(fixture.stream->get_connections()[0].host == "relay.example.com");
  CHECK(fixture.stream->get_connections()[0].port == "443");
  CHECK(fixture.stream->get_connections()[0].path == "/");
}

TEST_CASE("relay_connection reports handshake failures", "[nostr][relay_connection]")
{
  connection_fixture fixture;
  fixture.stream->set_connect_failure(true);

  CHECK_THROWS_AS(test::run_coroutine(fixture.io_context, fixture.connection->async_connect()), core::connection_failed);
  CHECK_FALSE(fixture.connection->is_open());
}

TEST_CASE("relay_connection rejects non-WebSocket URLs before dialing", "[nostr][relay_connection]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto stream = std::make_shared<test::test_double_websocket_stream>(io_context);
  auto connection = std::make_shared<connection_t>("https://relay.example.com", stream, io_context);

  CHECK_THROWS_AS(test::run_coroutine(io_context, connection->async_connect()), core::connection_failed);
  CHECK(stream->get_connections().empty());
}

SCENARIO("relay_connection runs a query until EOSE", "[nostr][relay_connection]")
{
  GIVEN("a connected relay serving two events")
  {
    connection_fixture fixture;
    fixture.stream->set_responder(serve_events({ make_event("a", 200), make_event("b", 100) }));
    fixture.connect();

    WHEN("a query is issued")
    {
      nostr::protocol::filter filter;
      filter.kinds = std::vector<int>{ 1 };
      const auto events =
        test::run_coroutine(fixture.io_context, fixture.connection->async_query(filter, std::chrono::seconds(2)));

      THEN("both events are returned")
      {
        REQUIRE(events.size() == 2);
        CHECK(events[0].id == "a");
        CHECK(events[1].id == "b");
      }

      THEN("the subscription is opened and then closed")
      {
        test::poll(fixture.io_context);
        const auto &writes = fixture.stream->get_writes();
        REQUIRE(writes.size() == 2);
        auto request = nostr::protocol::req::deserialize(writes[0]);
        REQUIRE(request.has_value());
        REQUIRE(request->filters.size() == 1);
        CHECK(request->filters[0] == filter);

        auto close_message = nlohmann::json::parse(writes[1]);
        CHECK(close_message[0] == "CLOSE");
        CHECK(close_message[1] == request->subscription_id);
      }
    }
  }
}

TEST_CASE("relay_connection ignores events for other subscriptions", "[nostr][relay_connection]")
{
  connection_fixture fixture;
  fixture.stream->set_responder([](const std::string &written) -> std::vector<std::string> {
    auto request = nostr::protocol::req::deserialize(written);
    if (not request) { return {}; }
    return { event_frame("someone-else", make_event("stray", 1)),
      "garbage",
      event_frame(request->subscription_id, make_event("mine", 2)),
      eose_frame(request->subscription_id) };
  });
  fixture.connect();

  const auto events = test::run_coroutine(
    fixture.io_context, fixture.connection->async_query(nostr::protocol::filter{}, std::chrono::seconds(2)));

  REQUIRE(events.size() == 1);
  CHECK(events[0].id == "mine");
}

TEST_CASE("relay_connection query timeouts", "[nostr][relay_connection]")
{
  SECTION("nothing received")
  {
    connection_fixture fixture;
    fixture.connect();

    CHECK_THROWS_AS(test::run_coroutine(fixture.io_context,
                      fixture.connection->async_query(nostr::protocol::filter{}, std::chrono::milliseconds(30))),
      core::query_timeout);
  }

  SECTION("partial results are kept")
  {
    connection_fixture fixture;
    fixture.stream->set_responder([](const std::string &written) -> std::vector<std::string> {
      auto request = nostr::protocol::req::deserialize(written);
      if (not request) { return {}; }
      return { event_frame(request->subscription_id, make_event("early", 10)) };
    });
    fixture.connect();

    const auto events = test::run_coroutine(fixture.io_context,
      fixture.connection->async_query(nostr::protocol::filter{}, std::chrono::milliseconds(30)));
    REQUIRE(events.size() == 1);
    CHECK(events[0].id == "early");
  }
}

TEST_CASE("relay_connection surfaces CLOSED as query_failed", "[nostr][relay_connection]")
{
  connection_fixture fixture;
  fixture.stream->set_responder([](const std::string &written) -> std::vector<std::string> {
    auto request = nostr::protocol::req::deserialize(written);
    if (not request) { return {}; }
    return { nlohmann::json::array({ "CLOSED", request->subscription_id, "error: too many filters" }).dump() };
  });
  fixture.connect();

  CHECK_THROWS_AS(test::run_coroutine(fixture.io_context,
                    fixture.connection->async_query(nostr::protocol::filter{}, std::chrono::seconds(2))),
    core::query_failed);
}

TEST_CASE("relay_connection refuses work when not connected", "[nostr][relay_connection]")
{
  connection_fixture fixture;

  CHECK_THROWS_AS(test::run_coroutine(fixture.io_context,
                    fixture.connection->async_query(nostr::protocol::filter{}, std::chrono::seconds(1))),
    core::query_failed);
  CHECK_THROWS_AS(test::run_coroutine(fixture.io_context,
                    fixture.connection->async_publish(make_event("x", 1), std::chrono::seconds(1))),
    core::connection_failed);
}

TEST_CASE("relay_connection publishes and waits for OK", "[nostr][relay_connection]")
{
  connection_fixture fixture;
  fixture.stream->set_responder([](const std::string &written) -> std::vector<std::string> {
    auto message = nlohmann::json::parse(written);
    if (message[0] != "EVENT") { return {}; }
    const auto event_id = message[1]["id"].get<std::string>();
    return { nlohmann::json::array({ "OK", event_id, event_id != "spam", event_id == "spam" ? "blocked: spam" : "" })
               .dump() };
  });
  fixture.connect();

  SECTION("accepted")
  {
    const auto response = test::run_coroutine(
      fixture.io_context, fixture.connection->async_publish(make_event("note", 1), std::chrono::seconds(2)));
    CHECK(response.accepted);
    CHECK(response.event_id == "note");
  }

  SECTION("rejected")
  {
    const auto response = test::run_coroutine(
      fixture.io_context, fixture.connection->async_publish(make_event("spam", 1), std::chrono::seconds(2)));
    CHECK_FALSE(response.accepted);
    CHECK(response.message == "blocked: spam");
  }
}

TEST_CASE("relay_connection close fails outstanding requests", "[nostr][relay_connection]")
{
  connection_fixture fixture;
  fixture.connect();

  auto pending = test::spawn(
    fixture.io_context, fixture.connection->async_query(nostr::protocol::filter{}, std::chrono::seconds(5)));
  test::poll(fixture.io_context);
  REQUIRE_FALSE(pending->done);

  fixture.connection->close();
  REQUIRE(test::run_until(fixture.io_context, [&pending] { return pending->done; }));

  REQUIRE(pending->error);
  CHECK_THROWS_AS(std::rethrow_exception(pending->error), core::query_failed);
  CHECK_FALSE(fixture.connection->is_open());
  CHECK(fixture.stream->close_count() == 1);

  fixture.connection->close();
  CHECK(fixture.stream->close_count() == 1);
}

TEST_CASE("relay_connection notices a dropped socket", "[nostr][relay_connection]")
{
  connection_fixture fixture;
  fixture.connect();

  auto pending = test::spawn(
    fixture.io_context, fixture.connection->async_query(nostr::protocol::filter{}, std::chrono::seconds(5)));
  test::poll(fixture.io_context);

  fixture.stream->drop_connection();
  REQUIRE(test::run_until(fixture.io_context, [&pending] { return pending->done; }));

  CHECK(pending->error);
  CHECK_FALSE(fixture.connection->is_open());
}

SCENARIO("relay_connection keeps live subscriptions open after EOSE", "[nostr][relay_connection][subscribe]")
{
  GIVEN("a connected relay with one stored event")
  {
    connection_fixture fixture;
    fixture.stream->set_responder(serve_events({ make_event("stored", 100) }));
    fixture.connect();

    std::vector<std::string> received;
    fixture.connection->subscribe("live-1", { nostr::protocol::filter{} }, [&received](const auto &event) {
      received.push_back(event.id);
    });
    REQUIRE(test::run_until(fixture.io_context, [&received] { return received.size() == 1; }));

    WHEN("the relay pushes an event after EOSE")
    {
      fixture.stream->push_frame(event_frame("live-1", make_event("fresh", 200)));
      REQUIRE(test::run_until(fixture.io_context, [&received] { return received.size() == 2; }));

      THEN("it is delivered and no CLOSE was sent")
      {
        CHECK(received == std::vector<std::string>{ "stored", "fresh" });
        CHECK(fixture.connection->live_subscriptions() == 1);
        CHECK(fixture.stream->get_writes().size() == 1);
      }
    }

    WHEN("the subscriber unsubscribes")
    {
      fixture.connection->unsubscribe("live-1");
      fixture.connection->unsubscribe("live-1");
      test::poll(fixture.io_context);
      fixture.stream->push_frame(event_frame("live-1", make_event("late", 300)));
      test::poll(fixture.io_context);

      THEN("one CLOSE is written and later events are ignored")
      {
        const auto &writes = fixture.stream->get_writes();
        REQUIRE(writes.size() == 2);
        const auto close_frame = nlohmann::json::parse(writes.back());
        CHECK(close_frame[0] == "CLOSE");
        CHECK(close_frame[1] == "live-1");
        CHECK(received == std::vector<std::string>{ "stored" });
        CHECK(fixture.connection->live_subscriptions() == 0);
      }
    }

    WHEN("the relay closes the subscription")
    {
      fixture.stream->push_frame(nlohmann::json::array({ "CLOSED", "live-1", "error: shutting down" }).dump());
      REQUIRE(test::run_until(
        fixture.io_context, [&fixture] { return fixture.connection->live_subscriptions() == 0; }));

      THEN("the session stays open") { CHECK(fixture.connection->is_open()); }
    }
  }
}

TEST_CASE("relay_connection refuses subscriptions while closed", "[nostr][relay_connection][subscribe]")
{
  connection_fixture fixture;
  CHECK_THROWS_AS(
    fixture.connection->subscribe("live-1", { nostr::protocol::filter{} }, [](const auto & /*event*/) {}),
    core::connection_failed);
}
