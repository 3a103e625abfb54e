#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <client/relay_client.hpp>
#include <core/errors.hpp>
#include <csignal>
#include <cstdlib>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <nostr/protocol.hpp>
#include <nostr/relay_connection.hpp>
#include <platform/env_utils.hpp>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <transport/websocket_stream.hpp>

namespace relay_feed {

namespace {

  using connection_t = nostr::relay_connection<transport::websocket_stream>;
  using client_t = client::relay_client<connection_t>;

  constexpr int exit_failure = 1;
  constexpr int exit_configuration = 2;
  constexpr int exit_transient = 3;

  auto make_client_config(const cli_utils::cli_args &args) -> client::client_config
  {
    client::client_config config;

    config.pool.max_connections = args.max_connections;
    config.pool.connection_timeout = std::chrono::milliseconds(args.connection_timeout_ms);
    config.pool.reconnect_delay = std::chrono::milliseconds(args.reconnect_delay_ms);
    config.pool.max_reconnect_attempts = args.max_reconnect_attempts;
    config.pool.relay_query_timeout = std::chrono::milliseconds(args.relay_query_timeout_ms);
    config.pool.publish_timeout = std::chrono::milliseconds(args.relay_query_timeout_ms);
    config.pool.resource_constrained = args.resource_constrained;

    config.throttle.max_slots[throttle::query_category::feed] = args.feed_slots;
    config.throttle.max_slots[throttle::query_category::metadata] = args.metadata_slots;
    config.throttle.max_slots[throttle::query_category::profile] = args.profile_slots;
    config.throttle.max_slots[throttle::query_category::discovery] = args.discovery_slots;
    config.slot_queue_timeout = std::chrono::milliseconds(args.queue_timeout_ms);

    config.feed.window.page_size = args.page_size;
    config.feed.thresholds.following_author_threshold = args.following_threshold;
    config.feed.slot_queue_timeout = config.slot_queue_timeout;
    if (args.max_age_days) { config.feed.limits.maximum_age = std::chrono::days(*args.max_age_days); }

    return config;
  }

  auto make_filter(const cli_utils::cli_args &args) -> nostr::protocol::filter
  {
    nostr::protocol::filter filter;
    if (not args.authors.empty()) { filter.authors = args.authors; }
    if (not args.kinds.empty()) { filter.kinds = args.kinds; }
    if (not args.hashtags.empty()) { filter.tags['t'] = args.hashtags; }
    return filter;
  }

  auto print_event(const nostr::protocol::event_data &event) -> void { fmt::print("{}\n", event.to_json().dump()); }

  auto read_event_file(const std::string &path) -> nostr::protocol::event_data
  {
    std::ifstream file(path);
    if (not file) { throw std::invalid_argument(fmt::format("Cannot open event file {}", path)); }
    const std::string contents{ std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
    auto event = nostr::protocol::event_data::deserialize(contents);
    if (not event) { throw std::invalid_argument(fmt::format("{} does not hold a valid event", path)); }
    return *event;
  }

  auto run_query(std::shared_ptr<client_t> client, cli_utils::cli_args args) -> boost::asio::awaitable<void>
  {
    auto filter = make_filter(args);
    filter.limit = args.query_limit;

    const auto events = co_await client->query(args.relays, filter);
    for (const auto &event : events) { print_event(event); }
    spdlog::info("[relay_feed] {} events from {} relays", events.size(), client->get_connected_relays().size());
  }

  auto run_feed(std::shared_ptr<client_t> client, cli_utils::cli_args args) -> boost::asio::awaitable<void>
  {
    const feed::filter_options visibility{ .show_replies = not args.hide_replies,
      .show_reposts = not args.hide_reposts,
      .block_flagged = not args.allow_flagged,
      .hashtags = args.hashtags,
      .muted_authors = args.muted_authors };

    // Hashtags narrow what is shown, not what is fetched
    auto filter = make_filter(args);
    filter.tags.erase('t');

    auto feed = client->query_paginated(args.relays, filter, std::nullopt, visibility);
    spdlog::info("[relay_feed] Paging {} feed", feed::to_string(feed->shape()));

    for (std::size_t index = 0; index < args.pages; ++index) {
      auto fetched = co_await feed->next_page();
      if (not fetched) { break; }
      spdlog::info("[relay_feed] Page {}: {} events, {} .. {}{}",
        index + 1,
        fetched->events.size(),
        platform::format_unix_timestamp(fetched->since),
        platform::format_unix_timestamp(fetched->until),
        fetched->soft_failed ? " (relays unavailable)" : "");
      if (feed->exhausted()) { break; }
    }

    for (const auto &event : feed->visible_events()) { print_event(event); }
  }

  auto run_publish(std::shared_ptr<client_t> client, cli_utils::cli_args args) -> boost::asio::awaitable<void>
  {
    auto event = read_event_file(args.publish_event_path);
    const auto accepted = co_await client->publish(args.relays, event);
    for (const auto &url : accepted) { fmt::print("accepted {}\n", url); }
  }

  auto run_status(std::shared_ptr<client_t> client, cli_utils::cli_args args) -> boost::asio::awaitable<void>
  {
    for (const auto &url : args.relays) {
      try {
        co_await client->connections()->get_connection(url);
      } catch (const core::relay_error &e) {
        spdlog::warn("[relay_feed] {}: {}", url, e.what());
      }
    }

    fmt::print("{:<40} {:<10} {:<22} {:<9} {}\n", "RELAY", "STATE", "LAST CONNECTED", "ATTEMPTS", "LAST ERROR");
    for (const auto &status : client->get_connection_statuses()) {
      fmt::print("{:<40} {:<10} {:<22} {:<9} {}\n",
        status.url,
        status.connected ? "connected" : "down",
        platform::format_time_point(status.last_connected_at),
        status.connection_attempts,
        status.last_error.value_or("-"));
    }

    const auto stats = client->get_connection_stats();
    fmt::print("\n{} relays, {} connected, {} failed ({})\n",
      stats.total,
      stats.active,
      stats.failed,
      platform::format_current_time_hms());
  }

  auto run_command(std::shared_ptr<client_t> client, cli_utils::cli_args args) -> boost::asio::awaitable<void>
  {
    if (args.query_parsed) {
      co_await run_query(client, args);
    } else if (args.feed_parsed) {
      co_await run_feed(client, args);
    } else if (args.publish_parsed) {
      co_await run_publish(client, args);
    } else if (args.status_parsed) {
      co_await run_status(client, args);
    }
  }

  auto report_failure(const std::exception_ptr &error) -> int
  {
    try {
      std::rethrow_exception(error);
    } catch (const core::publish_failed &e) {
      spdlog::error("[relay_feed] Publish failed on every relay:");
      for (const auto &failure : e.failures()) { spdlog::error("[relay_feed]   {}: {}", failure.url, failure.message); }
      return exit_transient;
    } catch (const core::relay_error &e) {
      spdlog::error("[relay_feed] {} ({}): {}", core::to_string(e.kind()), core::to_string(e.cause()), e.what());
      if (e.cause() == core::failure_cause::configuration) { return exit_configuration; }
      return e.is_transient() or e.cause() == core::failure_cause::timeout ? exit_transient : exit_failure;
    } catch (const std::invalid_argument &e) {
      spdlog::error("[relay_feed] {}", e.what());
      return exit_configuration;
    } catch (const std::exception &e) {
      spdlog::error("[relay_feed] {}", e.what());
      return exit_failure;
    }
  }

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = cli_utils::parse_cli_args(argc, argv);

  if (args.show_version) {
    fmt::print("relay-feed {}\n", cmake::project_version);
    return 0;
  }

  cli_utils::configure_logging(args);

  if (not cli_utils::validate_cli_args(args)) { return exit_configuration; }

  if (not(args.query_parsed or args.feed_parsed or args.publish_parsed or args.status_parsed)) {
    spdlog::error("No command given; run relay-feed --help");
    return exit_configuration;
  }

  cli_utils::print_app_banner(args);

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto factory = [io_context](const std::string &url) {
    return std::make_shared<connection_t>(url, std::make_shared<transport::websocket_stream>(io_context), io_context);
  };
  auto client = std::make_shared<client_t>(io_context, factory, make_client_config(args));
  client->start();

  boost::asio::cancellation_signal cancel_signal;
  boost::asio::signal_set signals(*io_context, SIGINT, SIGTERM);
  signals.async_wait([&cancel_signal](const boost::system::error_code &error, int signal_number) {
    if (error) { return; }
    spdlog::warn("[relay_feed] Received signal {}, cancelling", signal_number);
    cancel_signal.emit(boost::asio::cancellation_type::all);
  });

  int exit_code = 0;
  boost::asio::co_spawn(*io_context,
    run_command(client, args),
    boost::asio::bind_cancellation_slot(cancel_signal.slot(), [&](const std::exception_ptr &error) {
      signals.cancel();
      client->destroy();
      if (error) { exit_code = report_failure(error); }
    }));

  io_context->run();
  spdlog::debug("[relay_feed] io_context stopped");

  return exit_code;
}

}// namespace relay_feed

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int { return relay_feed::main(argc, argv); }
