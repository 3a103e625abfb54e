#include <feed/feed_aggregate.hpp>

#include <algorithm>
#include <ranges>

namespace relay_feed::feed {

namespace {

  auto newest_first(std::vector<nostr::protocol::event_data> &events) -> void
  {
    std::ranges::sort(events, [](const auto &lhs, const auto &rhs) {
      if (lhs.created_at != rhs.created_at) { return lhs.created_at > rhs.created_at; }
      return lhs.id < rhs.id;
    });
  }

}// namespace

auto feed_aggregate::add(nostr::protocol::event_data event) -> bool
{
  auto iter = events_.find(event.id);
  if (iter == events_.end()) {
    auto key = event.id;
    events_.emplace(std::move(key), std::move(event));
    return true;
  }
  if (event.created_at > iter->second.created_at) {
    iter->second = std::move(event);
    return true;
  }
  return false;
}

auto feed_aggregate::add(const std::vector<nostr::protocol::event_data> &events) -> std::size_t
{
  return static_cast<std::size_t>(std::ranges::count_if(events, [this](const auto &event) { return add(event); }));
}

auto feed_aggregate::all() const -> std::vector<nostr::protocol::event_data>
{
  std::vector<nostr::protocol::event_data> result;
  result.reserve(events_.size());
  for (const auto &[id, event] : events_) { result.push_back(event); }
  newest_first(result);
  return result;
}

auto feed_aggregate::visible(const content_filter &filter) const -> std::vector<nostr::protocol::event_data>
{
  std::vector<nostr::protocol::event_data> result;
  for (const auto &[id, event] : events_) {
    if (filter.is_visible(event)) { result.push_back(event); }
  }
  newest_first(result);
  return result;
}

auto feed_aggregate::oldest_created_at() const -> std::optional<std::uint64_t>
{
  if (events_.empty()) { return std::nullopt; }
  return std::ranges::min(events_ | std::views::values, {}, &nostr::protocol::event_data::created_at).created_at;
}

}// namespace relay_feed::feed
