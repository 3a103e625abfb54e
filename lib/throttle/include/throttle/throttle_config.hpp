#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace relay_feed::throttle {

/**
 * @brief Kinds of relay work that share the query budget.
 */
enum class query_category {
  feed,///< Primary timeline pages
  metadata,///< Profile metadata lookups
  profile,///< Single-author timelines
  discovery,///< Background relay and author discovery
};

inline constexpr std::array all_categories = {
  query_category::feed,
  query_category::metadata,
  query_category::profile,
  query_category::discovery,
};

[[nodiscard]] auto to_string(query_category category) -> std::string_view;

[[nodiscard]] auto parse_category(std::string_view name) -> std::optional<query_category>;

/**
 * @brief Per-category capacities and admission priority.
 */
struct throttle_config
{
  std::map<query_category, std::size_t> max_slots{
    { query_category::feed, 4 },
    { query_category::metadata, 5 },
    { query_category::profile, 2 },
    { query_category::discovery, 1 },
  };
  std::vector<query_category> priority{
    query_category::feed,
    query_category::profile,
    query_category::metadata,
    query_category::discovery,
  };
  std::size_t feed_slots_during_discovery{ 1 };///< Feed capacity while discovery runs

  [[nodiscard]] auto max_for(query_category category) const -> std::size_t;

  /// Position in the priority list; unlisted categories sort last
  [[nodiscard]] auto rank(query_category category) const -> std::size_t;
};

/**
 * @brief Process-wide facts that reshape the throttle.
 */
struct process_state
{
  bool discovery_active{ false };///< A background discovery task is running
};

/**
 * @brief Computes the configuration in force for a given process state.
 *
 * While discovery is active the feed capacity shrinks so background work
 * does not compete with it for relay bandwidth. Pure; called on every
 * admission decision.
 */
[[nodiscard]] auto effective_config(const throttle_config &base, const process_state &state) -> throttle_config;

}// namespace relay_feed::throttle
