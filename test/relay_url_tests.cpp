#include <catch2/catch_test_macros.hpp>
#include <nostr/relay_url.hpp>

using relay_feed::nostr::normalize_relay_url;
using relay_feed::nostr::parse_relay_endpoint;

TEST_CASE("normalize_relay_url produces one key per relay", "[nostr][relay_url]")
{
  SECTION("trailing slash and host case do not matter")
  {
    CHECK(normalize_relay_url("wss://Relay.Damus.IO/") == "wss://relay.damus.io");
    CHECK(normalize_relay_url("wss://relay.damus.io") == "wss://relay.damus.io");
  }

  SECTION("insecure and missing schemes become wss")
  {
    CHECK(normalize_relay_url("ws://nos.lol") == "wss://nos.lol");
    CHECK(normalize_relay_url("WS://nos.lol/") == "wss://nos.lol");
    CHECK(normalize_relay_url("nos.lol") == "wss://nos.lol");
  }

  SECTION("whitespace, query and fragment are dropped")
  {
    CHECK(normalize_relay_url("  wss://nos.lol/?ref=1  ") == "wss://nos.lol");
    CHECK(normalize_relay_url("wss://nos.lol#top") == "wss://nos.lol");
  }

  SECTION("default port is dropped and explicit ports are kept")
  {
    CHECK(normalize_relay_url("wss://nos.lol:443") == "wss://nos.lol");
    CHECK(normalize_relay_url("wss://nos.lol:7447/") == "wss://nos.lol:7447");
  }

  SECTION("paths are kept without trailing slashes")
  {
    CHECK(normalize_relay_url("wss://relay.example.com/inbox//") == "wss://relay.example.com/inbox");
  }

  SECTION("unparseable input is returned unchanged")
  {
    CHECK(normalize_relay_url("https://example.com") == "https://example.com");
    CHECK(normalize_relay_url("wss://") == "wss://");
    CHECK(normalize_relay_url("wss://host:abc") == "wss://host:abc");
  }

  SECTION("normalization is idempotent")
  {
    const auto once = normalize_relay_url("WS://Relay.Example.com:443/path/");
    CHECK(normalize_relay_url(once) == once);
  }
}

TEST_CASE("parse_relay_endpoint fills defaults for the transport", "[nostr][relay_url]")
{
  SECTION("bare host")
  {
    auto endpoint = parse_relay_endpoint("wss://nos.lol");
    REQUIRE(endpoint.has_value());
    CHECK(endpoint->host == "nos.lol");
    CHECK(endpoint->port == "443");
    CHECK(endpoint->path == "/");
  }

  SECTION("ws URLs are dialed over TLS on the secure port")
  {
    for (const auto *url : { "ws://nos.lol", "ws://nos.lol:80", "WS://nos.lol:80/" }) {
      auto endpoint = parse_relay_endpoint(url);
      REQUIRE(endpoint.has_value());
      CHECK(endpoint->host == "nos.lol");
      CHECK(endpoint->port == "443");
      CHECK(endpoint->path == "/");
    }
    CHECK(normalize_relay_url("ws://nos.lol:80") == "wss://nos.lol");
    CHECK(parse_relay_endpoint("ws://nos.lol:8080")->port == "8080");
    CHECK(parse_relay_endpoint("wss://nos.lol:80")->port == "80");
  }

  SECTION("explicit port and path")
  {
    auto endpoint = parse_relay_endpoint("wss://relay.example.com:7447/nostr");
    REQUIRE(endpoint.has_value());
    CHECK(endpoint->port == "7447");
    CHECK(endpoint->path == "/nostr");
  }

  SECTION("invalid URL")
  {
    CHECK_FALSE(parse_relay_endpoint("mailto://someone").has_value());
  }
}
