#pragma once

#include <CLI/CLI.hpp>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay_feed::cli_utils {

struct cli_args
{
  std::vector<std::string> relays;
  bool verbose = false;
  std::string log_level = "info";
  std::string log_file;
  bool show_version = false;

  // connection pool
  std::size_t max_connections = 20;
  std::int64_t connection_timeout_ms = 5000;
  std::int64_t reconnect_delay_ms = 5000;
  int max_reconnect_attempts = 3;
  std::int64_t relay_query_timeout_ms = 10000;
  bool resource_constrained = false;

  // throttle
  std::size_t feed_slots = 4;
  std::size_t metadata_slots = 5;
  std::size_t profile_slots = 2;
  std::size_t discovery_slots = 1;
  std::int64_t queue_timeout_ms = 30000;

  // shared filter options
  std::vector<std::string> authors;
  std::vector<int> kinds = { 1 };
  std::vector<std::string> hashtags;

  bool query_parsed = false;
  std::size_t query_limit = 20;

  bool feed_parsed = false;
  std::size_t pages = 3;
  std::size_t page_size = 20;
  std::size_t following_threshold = 10;
  std::optional<int> max_age_days;
  std::vector<std::string> muted_authors;
  bool hide_replies = false;
  bool hide_reposts = false;
  bool allow_flagged = false;

  bool publish_parsed = false;
  std::string publish_event_path;

  bool status_parsed = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

/**
 * @brief Parses argv into cli_args, exiting the process on --help or a parse error.
 */
inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "Relay Feed - paginated Nostr feed across many relays", "relay-feed" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    std::exit(app.exit(e));// NOLINT(concurrency-mt-unsafe)
  }

  args.publish_event_path = platform::expand_tilde_path(args.publish_event_path);

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.set_config("--config", platform::default_config_path(), "Read options from a TOML or INI file");

  app.add_option("-r,--relay", args.relays, "Relay URL (repeatable)");
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_option("--log-level", args.log_level, "Log level")
    ->check(CLI::IsMember({ "trace", "debug", "info", "warn", "error", "off" }));
  app.add_option("--log-file", args.log_file, "Also write logs to this file");
  app.add_flag("--version", args.show_version, "Show version information");

  auto *pool = app.add_option_group("pool", "Connection pool tuning");
  pool->add_option("--max-connections", args.max_connections, "Maximum concurrent relay connections")
    ->check(CLI::PositiveNumber);
  pool->add_option("--connection-timeout-ms", args.connection_timeout_ms, "Handshake timeout per relay")
    ->check(CLI::PositiveNumber);
  pool->add_option("--reconnect-delay-ms", args.reconnect_delay_ms, "Delay before a background reconnect")
    ->check(CLI::NonNegativeNumber);
  pool->add_option("--max-reconnect-attempts", args.max_reconnect_attempts, "Consecutive failures before giving up")
    ->check(CLI::PositiveNumber);
  pool->add_option("--relay-query-timeout-ms", args.relay_query_timeout_ms, "Per-relay wait for EOSE or OK")
    ->check(CLI::PositiveNumber);
  pool->add_flag("--resource-constrained", args.resource_constrained, "Use the longer health check interval");

  auto *throttle = app.add_option_group("throttle", "Query throttle tuning");
  throttle->add_option("--feed-slots", args.feed_slots, "Concurrent feed queries")->check(CLI::PositiveNumber);
  throttle->add_option("--metadata-slots", args.metadata_slots, "Concurrent metadata queries")
    ->check(CLI::PositiveNumber);
  throttle->add_option("--profile-slots", args.profile_slots, "Concurrent profile queries")->check(CLI::PositiveNumber);
  throttle->add_option("--discovery-slots", args.discovery_slots, "Concurrent discovery queries")
    ->check(CLI::PositiveNumber);
  throttle->add_option("--queue-timeout-ms", args.queue_timeout_ms, "Maximum wait for a query slot")
    ->check(CLI::PositiveNumber);

  auto *query_cmd = app.add_subcommand("query", "Run a one-shot query and print matching events");
  query_cmd->add_option("-a,--author", args.authors, "Author public key (hex, repeatable)");
  query_cmd->add_option("-k,--kind", args.kinds, "Event kind (repeatable)");
  query_cmd->add_option("-t,--hashtag", args.hashtags, "Hashtag (repeatable)");
  query_cmd->add_option("-l,--limit", args.query_limit, "Maximum events per relay")->check(CLI::PositiveNumber);
  query_cmd->callback([&args]() { args.query_parsed = true; });

  auto *feed_cmd = app.add_subcommand("feed", "Page backwards through a merged feed");
  feed_cmd->add_option("-a,--author", args.authors, "Author public key (hex, repeatable)");
  feed_cmd->add_option("-k,--kind", args.kinds, "Event kind (repeatable)");
  feed_cmd->add_option("-t,--hashtag", args.hashtags, "Only show notes with one of these hashtags");
  feed_cmd->add_option("-p,--pages", args.pages, "Number of pages to fetch")->check(CLI::PositiveNumber);
  feed_cmd->add_option("--page-size", args.page_size, "Events requested per page")->check(CLI::PositiveNumber);
  feed_cmd->add_option("--following-threshold", args.following_threshold, "Author count treated as a following feed")
    ->check(CLI::PositiveNumber);
  feed_cmd->add_option("--max-age-days", args.max_age_days, "Stop paging past this age")->check(CLI::PositiveNumber);
  feed_cmd->add_option("-m,--mute", args.muted_authors, "Hide this author (repeatable)");
  feed_cmd->add_flag("--hide-replies", args.hide_replies, "Hide replies");
  feed_cmd->add_flag("--hide-reposts", args.hide_reposts, "Hide reposts");
  feed_cmd->add_flag("--allow-flagged", args.allow_flagged, "Show content flagged as sensitive");
  feed_cmd->callback([&args]() { args.feed_parsed = true; });

  auto *publish_cmd = app.add_subcommand("publish", "Forward an already-signed event to the relays");
  publish_cmd->add_option("event", args.publish_event_path, "Path of a JSON file holding the signed event")
    ->required();
  publish_cmd->callback([&args]() { args.publish_parsed = true; });

  auto *status_cmd = app.add_subcommand("status", "Connect to every relay and print connection status");
  status_cmd->callback([&args]() { args.status_parsed = true; });

  app.require_subcommand(0, 1);
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  const auto needs_relays = args.query_parsed or args.feed_parsed or args.publish_parsed or args.status_parsed;
  if (needs_relays and args.relays.empty()) {
    spdlog::error("At least one --relay is required");
    return false;
  }

  if (args.publish_parsed and args.publish_event_path.empty()) {
    spdlog::error("Publish command requires an event file");
    return false;
  }

  if (args.feed_parsed and args.page_size == 0) {
    spdlog::error("Page size must be positive");
    return false;
  }

  return true;
}

}// namespace relay_feed::cli_utils
