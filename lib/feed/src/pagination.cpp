#include <feed/pagination.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>

namespace relay_feed::feed {

auto first_page_window(query_shape shape, const window_policy &policy, std::uint64_t now) -> page_window
{
  const auto width = static_cast<std::uint64_t>(policy.first_page_window(shape).count());
  return { .since = now > width ? now - width : 0, .until = now };
}

auto next_page_window(query_shape shape, std::uint64_t cursor, const window_policy &policy) -> page_window
{
  const auto width = static_cast<std::uint64_t>(policy.sliding_window(shape).count());
  return { .since = cursor > width ? cursor - width : 0, .until = cursor };
}

auto make_page_filter(const nostr::protocol::filter &base, const page_window &window, std::size_t limit)
  -> nostr::protocol::filter
{
  auto filter = base;
  filter.since = window.since;
  filter.until = window.until;
  filter.limit = limit;
  return filter;
}

auto compute_cursor(std::span<const nostr::protocol::event_data> raw_events,
  std::optional<std::uint64_t> oldest_visible,
  std::optional<std::uint64_t> requested_until,
  std::uint64_t until,
  std::uint64_t now) -> cursor_result
{
  auto base = now;
  if (oldest_visible) {
    base = *oldest_visible;
  } else if (not raw_events.empty()) {
    base = std::ranges::min(raw_events, {}, &nostr::protocol::event_data::created_at).created_at;
  } else if (requested_until) {
    base = *requested_until;
  }

  auto cursor = base > 0 ? base - 1 : 0;
  if (until > 0) { cursor = std::min(cursor, until - 1); }
  return { .next_cursor = cursor, .oldest_seen = base };
}

auto backoff_delay(int attempt, const retry_policy &policy) -> std::chrono::milliseconds
{
  const auto scaled = static_cast<double>(policy.base_delay.count()) * std::pow(policy.multiplier, std::max(attempt, 0));
  const auto capped = std::min(scaled, static_cast<double>(policy.max_delay.count()));
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

auto attempts_for(query_shape shape, const retry_policy &policy) -> int
{
  switch (shape) {
  case query_shape::following:
    return std::max(policy.following_attempts, 1);
  case query_shape::single_author:
    return std::max(policy.single_author_attempts, 1);
  case query_shape::global:
  case query_shape::multi_author:
    break;
  }
  return std::max(policy.default_attempts, 1);
}

auto query_timeout_for(query_shape shape, const timeout_policy &policy, std::size_t recent_failures)
  -> std::chrono::milliseconds
{
  auto timeout = policy.global;
  switch (shape) {
  case query_shape::following:
    timeout = policy.following;
    break;
  case query_shape::multi_author:
    timeout = policy.multi_author;
    break;
  case query_shape::single_author:
    timeout = policy.single_author;
    break;
  case query_shape::global:
    break;
  }
  if (recent_failures > policy.failure_threshold) { timeout = std::min(timeout, policy.degraded_cap); }
  return timeout;
}

auto soft_failed_page(const page_window &window, std::uint64_t now) -> page
{
  const auto requested = window.until > 0 ? std::optional<std::uint64_t>(window.until) : std::nullopt;
  const auto cursor = compute_cursor({}, std::nullopt, requested, window.until, now);
  return page{ .events = {},
    .since = window.since,
    .until = window.until,
    .next_cursor = cursor.next_cursor,
    .requested_until = requested,
    .oldest_seen = cursor.oldest_seen,
    .soft_failed = true };
}

auto dedupe_newest_first(std::vector<nostr::protocol::event_data> events) -> std::vector<nostr::protocol::event_data>
{
  std::unordered_map<std::string, std::size_t> index;
  std::vector<nostr::protocol::event_data> unique;
  unique.reserve(events.size());
  for (auto &event : events) {
    auto [iter, inserted] = index.try_emplace(event.id, unique.size());
    if (inserted) {
      unique.push_back(std::move(event));
    } else if (event.created_at > unique[iter->second].created_at) {
      unique[iter->second] = std::move(event);
    }
  }
  std::ranges::sort(unique, [](const auto &lhs, const auto &rhs) {
    if (lhs.created_at != rhs.created_at) { return lhs.created_at > rhs.created_at; }
    return lhs.id < rhs.id;
  });
  return unique;
}

}// namespace relay_feed::feed
