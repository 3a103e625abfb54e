#pragma once

#include <feed/feed_options.hpp>
#include <nostr/protocol.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace relay_feed::feed {

/**
 * @brief One fetched page of a paginated feed.
 */
struct page
{
  std::vector<nostr::protocol::event_data> events;///< Raw events, deduplicated, newest first
  std::uint64_t since{};///< Lower bound actually queried
  std::uint64_t until{};///< Upper bound actually queried
  std::uint64_t next_cursor{};///< Exclusive upper bound for the following page
  std::optional<std::uint64_t> requested_until;
  std::uint64_t oldest_seen{};
  bool soft_failed{ false };///< Placeholder for a page whose query failed softly
};

struct page_window
{
  std::uint64_t since{};
  std::uint64_t until{};
};

/**
 * @brief Window for the first page, anchored at now.
 */
[[nodiscard]] auto first_page_window(query_shape shape, const window_policy &policy, std::uint64_t now)
  -> page_window;

/**
 * @brief Sliding window ending at the previous page's cursor.
 *
 * The lower bound is always cursor minus the shape's sliding window so sparse
 * relays cannot make consecutive pages jump months into the past.
 */
[[nodiscard]] auto next_page_window(query_shape shape, std::uint64_t cursor, const window_policy &policy)
  -> page_window;

/**
 * @brief Copies the feed's base filter and applies a page window and limit.
 */
[[nodiscard]] auto make_page_filter(const nostr::protocol::filter &base, const page_window &window, std::size_t limit)
  -> nostr::protocol::filter;

struct cursor_result
{
  std::uint64_t next_cursor{};
  std::uint64_t oldest_seen{};
};

/**
 * @brief Computes the cursor for the page after this one.
 *
 * The base timestamp is the oldest visible event, else the oldest raw event,
 * else the requested upper bound, else now. The cursor is one second below
 * the base and never above until - 1, so it always moves backwards.
 *
 * @param raw_events Events as returned by the relays, before content filtering
 * @param oldest_visible Oldest created_at among events that pass the content filter
 * @param requested_until Upper bound the page asked for
 * @param until Upper bound actually queried, 0 when unbounded
 * @param now Current unix time
 */
[[nodiscard]] auto compute_cursor(std::span<const nostr::protocol::event_data> raw_events,
  std::optional<std::uint64_t> oldest_visible,
  std::optional<std::uint64_t> requested_until,
  std::uint64_t until,
  std::uint64_t now) -> cursor_result;

/// min(base * multiplier^attempt, max_delay)
[[nodiscard]] auto backoff_delay(int attempt, const retry_policy &policy) -> std::chrono::milliseconds;

[[nodiscard]] auto attempts_for(query_shape shape, const retry_policy &policy) -> int;

[[nodiscard]] auto query_timeout_for(query_shape shape, const timeout_policy &policy, std::size_t recent_failures)
  -> std::chrono::milliseconds;

/**
 * @brief Empty page standing in for a query that failed softly.
 */
[[nodiscard]] auto soft_failed_page(const page_window &window, std::uint64_t now) -> page;

/**
 * @brief Sorts newest first and drops duplicate ids, keeping the newest copy.
 */
[[nodiscard]] auto dedupe_newest_first(std::vector<nostr::protocol::event_data> events)
  -> std::vector<nostr::protocol::event_data>;

}// namespace relay_feed::feed
