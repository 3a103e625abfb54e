#pragma once

#include <nostr/protocol.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

namespace relay_feed::feed {

/**
 * @brief How broad a query is, derived from its author list.
 */
enum class query_shape {
  global,///< No author restriction
  single_author,///< Exactly one author
  multi_author,///< A handful of authors
  following,///< More authors than the following threshold
};

[[nodiscard]] auto to_string(query_shape shape) -> std::string_view;

struct shape_thresholds
{
  std::size_t following_author_threshold{ 10 };///< Author counts above this are "following" queries
};

[[nodiscard]] auto classify(const nostr::protocol::filter &filter, const shape_thresholds &thresholds = {})
  -> query_shape;

/**
 * @brief Time windows per page, in seconds.
 *
 * Following feeds start narrow because many authors are queried at once, then
 * slide wider than other shapes since their matching notes are sparse.
 */
struct window_policy
{
  std::chrono::seconds following_first_page{ std::chrono::days(7) };
  std::chrono::seconds default_first_page{ std::chrono::days(30) };
  std::chrono::seconds following_sliding_window{ std::chrono::days(180) };
  std::chrono::seconds default_sliding_window{ std::chrono::days(90) };
  std::size_t page_size{ 20 };

  [[nodiscard]] auto first_page_window(query_shape shape) const -> std::chrono::seconds
  {
    return shape == query_shape::following ? following_first_page : default_first_page;
  }

  [[nodiscard]] auto sliding_window(query_shape shape) const -> std::chrono::seconds
  {
    return shape == query_shape::following ? following_sliding_window : default_sliding_window;
  }
};

/**
 * @brief Page query timeouts by shape.
 *
 * Broad queries wait longer since more relays have to scan more authors.
 * After repeated recent failures every timeout is capped so that a degraded
 * network is detected faster.
 */
struct timeout_policy
{
  std::chrono::milliseconds following{ 35000 };
  std::chrono::milliseconds multi_author{ 25000 };
  std::chrono::milliseconds single_author{ 20000 };
  std::chrono::milliseconds global{ 15000 };
  std::size_t failure_threshold{ 3 };///< Recent failures above this trigger the cap
  std::chrono::milliseconds degraded_cap{ 8000 };
};

struct retry_policy
{
  int following_attempts{ 1 };
  int single_author_attempts{ 3 };
  int default_attempts{ 2 };
  std::chrono::milliseconds base_delay{ 1000 };
  double multiplier{ 1.5 };
  std::chrono::milliseconds max_delay{ 3000 };
  bool retry_empty_results{ true };///< Treat an empty page as retryable unless it is the last attempt
};

struct pagination_limits
{
  std::size_t max_consecutive_empty_pages{ 5 };
  std::size_t max_pages{ 500 };
  std::optional<std::chrono::seconds> maximum_age;///< Stop once older content than this is reached
  std::size_t maximum_age_min_pages{ 3 };///< Pages required before maximum_age applies
};

/**
 * @brief Which shapes turn a final transient failure into an empty page.
 */
struct soft_failure_policy
{
  bool global{ false };
  bool single_author{ false };
  bool multi_author{ true };
  bool following{ true };

  [[nodiscard]] auto allows(query_shape shape) const -> bool
  {
    switch (shape) {
    case query_shape::global:
      return global;
    case query_shape::single_author:
      return single_author;
    case query_shape::multi_author:
      return multi_author;
    case query_shape::following:
      return following;
    }
    return false;
  }
};

/**
 * @brief Everything that tunes one paginated feed.
 */
struct feed_options
{
  shape_thresholds thresholds;
  window_policy window;
  timeout_policy timeouts;
  retry_policy retries;
  pagination_limits limits;
  soft_failure_policy soft_failure;
  std::chrono::milliseconds slot_queue_timeout{ 30000 };///< Wait for a feed throttle slot
};

}// namespace relay_feed::feed
