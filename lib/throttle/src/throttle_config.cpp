#include <throttle/throttle_config.hpp>

#include <algorithm>

namespace relay_feed::throttle {

auto to_string(query_category category) -> std::string_view
{
  switch (category) {
  case query_category::feed:
    return "feed";
  case query_category::metadata:
    return "metadata";
  case query_category::profile:
    return "profile";
  case query_category::discovery:
    return "discovery";
  }
  return "unknown";
}

auto parse_category(std::string_view name) -> std::optional<query_category>
{
  for (const auto category : all_categories) {
    if (to_string(category) == name) { return category; }
  }
  return std::nullopt;
}

auto throttle_config::max_for(query_category category) const -> std::size_t
{
  auto iter = max_slots.find(category);
  return iter == max_slots.end() ? 0 : iter->second;
}

auto throttle_config::rank(query_category category) const -> std::size_t
{
  auto iter = std::ranges::find(priority, category);
  return static_cast<std::size_t>(std::distance(priority.begin(), iter));
}

auto effective_config(const throttle_config &base, const process_state &state) -> throttle_config
{
  auto config = base;
  if (state.discovery_active) {
    config.max_slots[query_category::feed] = std::min(base.max_for(query_category::feed), base.feed_slots_during_discovery);
  }
  return config;
}

}// namespace relay_feed::throttle
