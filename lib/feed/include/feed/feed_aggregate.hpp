#pragma once

#include <feed/content_filter.hpp>
#include <nostr/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay_feed::feed {

/**
 * @brief Every event a feed has seen, keyed by id across relays and pages.
 *
 * When the same id arrives twice the copy with the newest created_at is kept.
 */
class feed_aggregate
{
public:
  /// @return true when the event was new or replaced an older copy
  auto add(nostr::protocol::event_data event) -> bool;

  /// @return Number of events that were new or replaced an older copy
  auto add(const std::vector<nostr::protocol::event_data> &events) -> std::size_t;

  [[nodiscard]] auto contains(const std::string &event_id) const -> bool { return events_.contains(event_id); }
  [[nodiscard]] auto size() const -> std::size_t { return events_.size(); }
  [[nodiscard]] auto empty() const -> bool { return events_.empty(); }
  auto clear() -> void { events_.clear(); }

  /// All events, newest first
  [[nodiscard]] auto all() const -> std::vector<nostr::protocol::event_data>;

  /// Events passing the filter, newest first; evaluated on every call
  [[nodiscard]] auto visible(const content_filter &filter) const -> std::vector<nostr::protocol::event_data>;

  [[nodiscard]] auto oldest_created_at() const -> std::optional<std::uint64_t>;

private:
  std::unordered_map<std::string, nostr::protocol::event_data> events_;
};

}// namespace relay_feed::feed
