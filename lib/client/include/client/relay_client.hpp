#pragma once

#include <concepts/relay_connection.hpp>
#include <feed/feed_orchestrator.hpp>
#include <feed/paginated_feed.hpp>
#include <nostr/protocol.hpp>
#include <pool/connection_pool.hpp>
#include <pool/pool_config.hpp>
#include <pool/subscription.hpp>
#include <throttle/query_throttle.hpp>
#include <throttle/throttle_config.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relay_feed::client {

/**
 * @brief Configuration for every layer owned by relay_client.
 */
struct client_config
{
  pool::pool_config pool;
  throttle::throttle_config throttle;
  feed::feed_options feed;
  feed::flag_lists flags;
  std::chrono::milliseconds slot_queue_timeout{ 30000 };///< Queue timeout for query and publish slots
  std::size_t max_cached_feeds{ 32 };///< Idle paginated feeds beyond this are evicted, least recently used first
};

/**
 * @brief Entry point for consumers of the relay layer.
 *
 * Wires a connection pool, a query throttle and a feed orchestrator together.
 * The client must outlive every coroutine it starts.
 * One-shot queries and publishes each hold a throttle slot for their whole
 * round-trip; paginated feeds acquire their own feed slots per page.
 * Live subscriptions go straight to the pool.
 *
 * @tparam Connection Session type satisfying concepts::relay_connection
 */
template<concepts::relay_connection Connection>
class relay_client
{
public:
  using pool_type = pool::connection_pool<Connection>;
  using feed_type = feed::paginated_feed<pool_type>;

  relay_client(const std::shared_ptr<boost::asio::io_context> &io_context,
    typename pool_type::connection_factory factory,
    client_config config = {})
    : config_(std::move(config)),
      pool_(std::make_shared<pool_type>(io_context, std::move(factory), config_.pool)),
      throttle_(std::make_shared<throttle::query_throttle>(io_context, config_.throttle)),
      orchestrator_(pool_, throttle_, config_.feed, config_.flags, config_.max_cached_feeds)
  {}

  relay_client(const relay_client &) = delete;
  auto operator=(const relay_client &) -> relay_client & = delete;
  relay_client(relay_client &&) = delete;
  auto operator=(relay_client &&) -> relay_client & = delete;
  ~relay_client() = default;

  /// Starts background health checks
  auto start() -> void { pool_->start(); }

  /**
   * @brief One-shot query across relays, holding a slot of the given category.
   *
   * @throws core::throttle_timeout or core::throttle_aborted while queued
   * @throws core::query_timeout, core::query_failed or core::no_relays_configured from the pool
   */
  auto query(std::vector<std::string> urls,
    nostr::protocol::filter filter,
    throttle::query_category category = throttle::query_category::metadata)
    -> boost::asio::awaitable<std::vector<nostr::protocol::event_data>>
  {
    if (urls.empty()) { throw core::no_relays_configured(); }
    auto slot = co_await throttle_->acquire_scoped(category, { .cancel_slot = nullptr, .queue_timeout = config_.slot_queue_timeout });
    co_return co_await pool_->query(std::move(urls), std::move(filter));
  }

  /**
   * @brief Returns the paginated feed for relays and filter; pull pages with next_page().
   */
  auto query_paginated(const std::vector<std::string> &urls,
    const nostr::protocol::filter &filter,
    std::optional<feed::feed_options> options = std::nullopt,
    feed::filter_options visibility = {}) -> std::shared_ptr<feed_type>
  {
    return orchestrator_.query_paginated(urls, filter, std::move(options), std::move(visibility));
  }

  /**
   * @brief Publishes a signed event, succeeding when at least one relay accepts it.
   *
   * @return URLs of the accepting relays
   * @throws core::publish_failed listing every relay's error when none accepted
   */
  auto publish(std::vector<std::string> urls, nostr::protocol::event_data event)
    -> boost::asio::awaitable<std::vector<std::string>>
  {
    if (urls.empty()) { throw core::no_relays_configured(); }
    auto slot = co_await throttle_->acquire_scoped(
      throttle::query_category::metadata, { .cancel_slot = nullptr, .queue_timeout = config_.slot_queue_timeout });
    co_return co_await pool_->publish(std::move(urls), std::move(event));
  }

  /**
   * @brief Opens a live subscription that keeps delivering events after EOSE.
   *
   * Holds no throttle slot; the subscription lives until the handle is closed
   * or destroyed.
   */
  auto subscribe(const std::vector<std::string> &urls,
    std::vector<nostr::protocol::filter> filters,
    nostr::protocol::event_callback on_event) -> pool::subscription
  {
    return pool_->subscribe(urls, std::move(filters), std::move(on_event));
  }

  [[nodiscard]] auto get_connection_statuses() const -> std::vector<pool::connection_status>
  {
    return pool_->get_connection_statuses();
  }

  [[nodiscard]] auto is_connected(const std::string &url) const -> bool { return pool_->is_connected(url); }

  [[nodiscard]] auto get_connected_relays() const -> std::vector<std::string> { return pool_->get_connected_relays(); }

  [[nodiscard]] auto get_connection_stats() const -> pool::connection_stats { return pool_->get_connection_stats(); }

  auto reset_connection_attempts() -> void { pool_->reset_connection_attempts(); }

  auto force_cleanup() -> std::size_t { return pool_->force_cleanup(); }

  /**
   * @brief Tears down the pool, aborts queued slot waiters and forgets every feed. Idempotent.
   */
  auto destroy() -> void
  {
    if (pool_->is_destroyed()) { return; }
    spdlog::info("[relay_client] Shutting down");
    pool_->destroy();
    throttle_->reset();
    orchestrator_.clear();
  }

  auto acquire_slot(throttle::query_category category, throttle::acquire_options options = {})
    -> boost::asio::awaitable<throttle::slot_token>
  {
    return throttle_->acquire(category, std::move(options));
  }

  auto release_slot(const throttle::slot_token &token) -> void { throttle_->release(token); }

  /// Shrinks the feed budget while a background discovery task runs
  auto set_discovery_active(bool active) -> void { throttle_->set_discovery_active(active); }

  auto set_foreground(bool foreground) -> void { pool_->set_foreground(foreground); }

  [[nodiscard]] auto connections() const -> const std::shared_ptr<pool_type> & { return pool_; }
  [[nodiscard]] auto throttler() const -> const std::shared_ptr<throttle::query_throttle> & { return throttle_; }
  [[nodiscard]] auto orchestrator() -> feed::feed_orchestrator<pool_type> & { return orchestrator_; }
  [[nodiscard]] auto config() const -> const client_config & { return config_; }

private:
  client_config config_;
  std::shared_ptr<pool_type> pool_;
  std::shared_ptr<throttle::query_throttle> throttle_;
  feed::feed_orchestrator<pool_type> orchestrator_;
};

}// namespace relay_feed::client
