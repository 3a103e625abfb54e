#pragma once

#include <concepts/relay_query_client.hpp>
#include <feed/content_filter.hpp>
#include <feed/failure_tracker.hpp>
#include <feed/feed_options.hpp>
#include <feed/paginated_feed.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_url.hpp>
#include <throttle/query_throttle.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay_feed::feed {

/**
 * @brief Owns the paginated feeds of one client, one per logical feed.
 *
 * A logical feed is identified by its relay set and its filter without the
 * time window, so asking twice for the same feed resumes pagination instead
 * of starting over. Every feed shares the orchestrator's failure tracker.
 * At most capacity feeds are kept; the least recently requested idle feed is
 * dropped first, and a feed with a fetch in flight is never dropped.
 *
 * @tparam Client Type satisfying concepts::relay_query_client
 */
template<concepts::relay_query_client Client>
class feed_orchestrator
{
public:
  using feed_type = paginated_feed<Client>;

  static constexpr std::size_t default_capacity = 32;

  feed_orchestrator(std::shared_ptr<Client> client,
    std::shared_ptr<throttle::query_throttle> throttle,
    feed_options defaults = {},
    flag_lists flags = {},
    std::size_t capacity = default_capacity)
    : client_(std::move(client)), throttle_(std::move(throttle)), defaults_(std::move(defaults)),
      flagger_(std::move(flags)), capacity_(std::max<std::size_t>(capacity, 1))
  {}

  /**
   * @brief Identity of a logical feed.
   *
   * @return Sorted, normalized relay URLs joined with the filter signature
   */
  [[nodiscard]] static auto feed_signature(const std::vector<std::string> &relays, const nostr::protocol::filter &filter)
    -> std::string
  {
    return fmt::format("{}|{}", fmt::join(canonical_relays(relays), ","), filter.signature());
  }

  /**
   * @brief Returns the feed for relays and filter, creating it on first use.
   *
   * Options apply only when the feed is created.
   */
  auto query_paginated(const std::vector<std::string> &relays,
    const nostr::protocol::filter &filter,
    std::optional<feed_options> options = std::nullopt,
    feed::filter_options visibility = {}) -> std::shared_ptr<feed_type>
  {
    auto key = feed_signature(relays, filter);
    if (auto iter = feeds_.find(key); iter != feeds_.end()) {
      recency_.splice(recency_.begin(), recency_, iter->second.position);
      return iter->second.feed;
    }

    auto created = std::make_shared<feed_type>(client_,
      throttle_,
      failures_,
      canonical_relays(relays),
      filter,
      options.value_or(defaults_),
      content_filter(std::move(visibility), flagger_));
    spdlog::debug("[feed_orchestrator] New {} feed over {} relays", to_string(created->shape()), created->relays().size());
    recency_.push_front(key);
    feeds_.emplace(std::move(key), entry{ .feed = created, .position = recency_.begin() });
    evict_idle();
    return created;
  }

  [[nodiscard]] auto find(const std::string &key) const -> std::shared_ptr<feed_type>
  {
    auto iter = feeds_.find(key);
    return iter == feeds_.end() ? nullptr : iter->second.feed;
  }

  /// @return true when a feed was dropped
  auto forget(const std::string &key) -> bool
  {
    auto iter = feeds_.find(key);
    if (iter == feeds_.end()) { return false; }
    recency_.erase(iter->second.position);
    feeds_.erase(iter);
    return true;
  }

  auto clear() -> void
  {
    feeds_.clear();
    recency_.clear();
  }

  [[nodiscard]] auto size() const -> std::size_t { return feeds_.size(); }
  [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }
  [[nodiscard]] auto failures() const -> const failure_tracker & { return *failures_; }
  [[nodiscard]] auto defaults() const -> const feed_options & { return defaults_; }

private:
  std::shared_ptr<Client> client_;
  std::shared_ptr<throttle::query_throttle> throttle_;
  feed_options defaults_;
  content_flagger flagger_;
  std::shared_ptr<failure_tracker> failures_{ std::make_shared<failure_tracker>() };
  struct entry
  {
    std::shared_ptr<feed_type> feed;
    std::list<std::string>::iterator position;
  };

  std::size_t capacity_;
  std::list<std::string> recency_;// most recently requested first
  std::unordered_map<std::string, entry> feeds_;

  // Callers keep evicted feeds alive through their own handles
  auto evict_idle() -> void
  {
    auto iter = recency_.end();
    // The front entry was just requested and always stays
    while (feeds_.size() > capacity_ and iter != recency_.begin() and std::prev(iter) != recency_.begin()) {
      --iter;
      auto found = feeds_.find(*iter);
      if (found->second.feed->fetching()) { continue; }
      spdlog::debug("[feed_orchestrator] Evicting idle feed {}", *iter);
      feeds_.erase(found);
      iter = recency_.erase(iter);
    }
    if (feeds_.size() > capacity_) {
      spdlog::debug("[feed_orchestrator] {} feeds cached, all busy beyond capacity {}", feeds_.size(), capacity_);
    }
  }

  static auto canonical_relays(const std::vector<std::string> &relays) -> std::vector<std::string>
  {
    std::vector<std::string> result;
    result.reserve(relays.size());
    std::ranges::transform(relays, std::back_inserter(result), [](const auto &url) { return nostr::normalize_relay_url(url); });
    std::ranges::sort(result);
    auto [first, last] = std::ranges::unique(result);
    result.erase(first, last);
    return result;
  }
};

}// namespace relay_feed::feed
