#pragma once

#include <async/timeout.hpp>
#include <async/when_all.hpp>
#include <concepts/relay_connection.hpp>
#include <core/errors.hpp>
#include <core/uuid_generator.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_url.hpp>
#include <pool/connection_registry.hpp>
#include <pool/pool_config.hpp>
#include <pool/subscription.hpp>

#include <boost/asio.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace relay_feed::pool {

/**
 * @brief Owns the live relay connections, keyed by normalized URL.
 *
 * Concurrent requests for the same relay share one dial through an explicit
 * in-flight registry. Failed dials count against a per-relay attempt cap, a
 * periodic health check retires dead connections, and bounded background
 * reconnects bring them back.
 *
 * Must be owned by a std::shared_ptr; call start() to begin health checks and
 * destroy() to tear everything down.
 *
 * @tparam Connection Session type satisfying concepts::relay_connection
 */
template<concepts::relay_connection Connection>
class connection_pool : public std::enable_shared_from_this<connection_pool<Connection>>
{
public:
  using connection_factory = std::function<std::shared_ptr<Connection>(const std::string &url)>;

  /**
   * @brief Constructs a connection pool.
   *
   * @param io_context io_context running every pool coroutine
   * @param factory Creates an unconnected session for a normalized URL
   * @param config Pool tuning
   */
  connection_pool(const std::shared_ptr<boost::asio::io_context> &io_context,
    connection_factory factory,
    pool_config config = {})
    : io_context_(io_context), factory_(std::move(factory)), config_(config), health_timer_(*io_context)
  {}

  connection_pool(const connection_pool &) = delete;
  auto operator=(const connection_pool &) -> connection_pool & = delete;
  connection_pool(connection_pool &&) = delete;
  auto operator=(connection_pool &&) -> connection_pool & = delete;
  ~connection_pool() = default;

  [[nodiscard]] auto config() const -> const pool_config & { return config_; }

  /**
   * @brief Returns an open connection to url, dialing when needed.
   *
   * @param url Relay URL, normalized before use
   * @return Shared handle to the open session
   * @throws core::connection_timeout when the handshake exceeds the connection timeout
   * @throws core::connection_failed when the transport reports an error
   * @throws core::connection_limit_exceeded when the pool is full
   * @throws core::max_attempts_exceeded when the relay already failed too often; no dial is made
   * @throws core::pool_destroyed after destroy()
   */
  auto get_connection(std::string url) -> boost::asio::awaitable<std::shared_ptr<Connection>>
  {
    if (destroyed_) { throw core::pool_destroyed(); }

    auto self = this->shared_from_this();
    const auto key = nostr::normalize_relay_url(url);
    registry_.ensure(key);

    if (auto iter = active_.find(key); iter != active_.end()) {
      if (iter->second->is_open()) { co_return iter->second; }
      spdlog::debug("[connection_pool] Dropping closed connection to {}", key);
      auto stale = iter->second;
      active_.erase(iter);
      registry_.mark_disconnected(key);
      stale->close();
    }

    auto dial = find_or_start_dial(key);

    if (co_await dial->done.wait() != async::wait_status::notified) {
      throw boost::system::system_error(boost::asio::error::operation_aborted);
    }
    if (dial->error) { std::rethrow_exception(dial->error); }

    co_return dial->connection;
  }

  /**
   * @brief One-shot query fanned out to every relay.
   *
   * @return Events from all relays that answered, deduplicated by id, newest first
   * @throws core::no_relays_configured when urls is empty
   * @throws core::query_timeout when every relay timed out
   * @throws core::query_failed when every relay failed and at least one did not time out
   */
  auto query(std::vector<std::string> urls, nostr::protocol::filter filter)
    -> boost::asio::awaitable<std::vector<nostr::protocol::event_data>>
  {
    if (destroyed_) { throw core::pool_destroyed(); }

    auto self = this->shared_from_this();
    const auto keys = normalize_all(urls);
    if (keys.empty()) { throw core::no_relays_configured(); }

    std::vector<boost::asio::awaitable<std::vector<nostr::protocol::event_data>>> tasks;
    tasks.reserve(keys.size());
    for (const auto &key : keys) { tasks.push_back(query_relay(key, filter)); }

    auto results = co_await async::when_all_settled(std::move(tasks));

    std::unordered_map<std::string, nostr::protocol::event_data> merged;
    std::vector<std::string> errors;
    bool all_timeouts = true;
    for (std::size_t index = 0; index < results.size(); ++index) {
      auto &result = results[index];
      if (not result.ok()) {
        all_timeouts = all_timeouts and core::is_timeout(result.error);
        errors.push_back(fmt::format("{}: {}", keys[index], core::describe(result.error)));
        continue;
      }
      for (auto &event : *result.value) {
        auto [iter, inserted] = merged.try_emplace(event.id, event);
        if (not inserted and event.created_at > iter->second.created_at) { iter->second = std::move(event); }
      }
    }

    if (errors.size() == keys.size()) {
      if (all_timeouts) { throw core::query_timeout(fmt::format("All {} relays timed out", keys.size())); }
      throw core::query_failed(fmt::format("{}", fmt::join(errors, "; ")));
    }
    if (not errors.empty()) {
      spdlog::debug("[connection_pool] Query answered by {}/{} relays", keys.size() - errors.size(), keys.size());
    }

    std::vector<nostr::protocol::event_data> events;
    events.reserve(merged.size());
    for (auto &[id, event] : merged) { events.push_back(std::move(event)); }
    std::ranges::sort(events, [](const auto &lhs, const auto &rhs) {
      return lhs.created_at != rhs.created_at ? lhs.created_at > rhs.created_at : lhs.id < rhs.id;
    });

    co_return events;
  }

  /**
   * @brief Forwards a signed event to every relay.
   *
   * @return URLs of the relays that accepted the event
   * @throws core::no_relays_configured when urls is empty
   * @throws core::publish_failed with one entry per relay when none accepted
   */
  auto publish(std::vector<std::string> urls, nostr::protocol::event_data event)
    -> boost::asio::awaitable<std::vector<std::string>>
  {
    if (destroyed_) { throw core::pool_destroyed(); }

    auto self = this->shared_from_this();
    const auto keys = normalize_all(urls);
    if (keys.empty()) { throw core::no_relays_configured(); }

    std::vector<boost::asio::awaitable<nostr::protocol::ok>> tasks;
    tasks.reserve(keys.size());
    for (const auto &key : keys) { tasks.push_back(publish_relay(key, event)); }

    auto results = co_await async::when_all_settled(std::move(tasks));

    std::vector<std::string> accepted;
    std::vector<core::relay_failure> failures;
    for (std::size_t index = 0; index < results.size(); ++index) {
      const auto &result = results[index];
      if (not result.ok()) {
        failures.push_back({ .url = keys[index], .message = core::describe(result.error) });
      } else if (not result.value->accepted) {
        failures.push_back(
          { .url = keys[index], .message = result.value->message.empty() ? "rejected" : result.value->message });
      } else {
        accepted.push_back(keys[index]);
      }
    }

    if (accepted.empty()) { throw core::publish_failed(std::move(failures)); }

    spdlog::info("[connection_pool] Event {} accepted by {}/{} relays", event.id, accepted.size(), keys.size());
    co_return accepted;
  }

  /**
   * @brief Opens a long-lived subscription on every relay.
   *
   * Relays are attached in the background. A relay that cannot be reached is
   * retried through the reconnect schedule, and every later dial to a
   * subscribed relay sends the REQ again, so the subscription survives
   * reconnects. Each event id is delivered once across relays.
   *
   * @return Handle whose close() sends CLOSE on every attached relay
   * @throws core::no_relays_configured when urls is empty
   * @throws core::pool_destroyed after destroy()
   */
  auto subscribe(const std::vector<std::string> &urls,
    std::vector<nostr::protocol::filter> filters,
    nostr::protocol::event_callback on_event) -> subscription
  {
    if (destroyed_) { throw core::pool_destroyed(); }
    auto keys = normalize_all(urls);
    if (keys.empty()) { throw core::no_relays_configured(); }

    auto id = core::uuid_generator::subscription_id("live");
    auto entry = std::make_shared<live_subscription>();
    entry->urls = keys;
    entry->filters = std::move(filters);
    entry->on_event = std::move(on_event);
    subscriptions_[id] = entry;
    spdlog::info("[connection_pool] Subscription {} opened on {} relays", id, keys.size());

    for (const auto &key : keys) { spawn_attach(id, key); }

    return { id, [weak = this->weak_from_this()](const std::string &sub_id) {
              if (auto self = weak.lock()) { self->unsubscribe(sub_id); }
            } };
  }

  /**
   * @brief Closes a live subscription on every relay it reached. Unknown IDs are ignored.
   */
  auto unsubscribe(const std::string &id) -> void
  {
    auto iter = subscriptions_.find(id);
    if (iter == subscriptions_.end()) { return; }
    auto entry = iter->second;
    subscriptions_.erase(iter);
    entry->closed = true;

    for (const auto &[url, attached] : entry->attached) {
      if (auto connection = attached.lock(); connection and connection->is_open()) { connection->unsubscribe(id); }
    }
    spdlog::info("[connection_pool] Subscription {} closed", id);
  }

  [[nodiscard]] auto subscription_count() const -> std::size_t { return subscriptions_.size(); }

  /**
   * @brief Starts the periodic health check. No-op once running or destroyed.
   */
  auto start() -> void
  {
    if (destroyed_ or health_running_) { return; }
    health_running_ = true;
    boost::asio::co_spawn(*io_context_, health_loop(), [](const std::exception_ptr &error) {
      if (error) { spdlog::error("[connection_pool] Health loop exited: {}", core::describe(error)); }
    });
  }

  /**
   * @brief Suspends health checks while the process is not visible.
   */
  auto set_foreground(bool foreground) -> void { foreground_ = foreground; }

  /**
   * @brief Walks active connections once. Failures are logged, never thrown.
   */
  auto check_health() -> void
  {
    if (destroyed_) { return; }
    if (not foreground_) {
      spdlog::trace("[connection_pool] Skipping health check while in background");
      return;
    }

    const auto now = clock::now();
    std::vector<std::string> unhealthy;
    for (const auto &[url, connection] : active_) {
      registry_.record_health_check(url, now);
      if (not connection->is_open()) { unhealthy.push_back(url); }
    }

    for (const auto &url : unhealthy) { handle_connection_failure(url, "health check failed"); }
    spdlog::debug("[connection_pool] Health check: {} active, {} unhealthy", active_.size(), unhealthy.size());
  }

  /**
   * @brief Closes specific relays and marks them disconnected.
   */
  auto close(const std::vector<std::string> &urls) -> void
  {
    for (const auto &url : urls) {
      const auto key = nostr::normalize_relay_url(url);
      cancel_reconnect(key);
      if (auto iter = active_.find(key); iter != active_.end()) {
        auto connection = iter->second;
        active_.erase(iter);
        connection->close();
      }
      registry_.mark_disconnected(key);
    }
  }

  /**
   * @brief Tears the pool down. Safe to call more than once.
   *
   * Stops every timer, fails in-flight dials with core::pool_destroyed,
   * closes each active connection exactly once and clears all state.
   */
  auto destroy() -> void
  {
    if (destroyed_) { return; }
    destroyed_ = true;

    health_timer_.cancel();
    for (const auto &[url, timer] : reconnect_timers_) { timer->cancel(); }
    reconnect_timers_.clear();

    auto in_flight = std::move(in_flight_);
    in_flight_.clear();
    for (const auto &[url, dial] : in_flight) { abandon(dial, std::make_exception_ptr(core::pool_destroyed())); }

    for (const auto &[id, entry] : subscriptions_) { entry->closed = true; }
    subscriptions_.clear();

    auto active = std::move(active_);
    active_.clear();
    for (const auto &[url, connection] : active) { connection->close(); }

    registry_.clear();
    spdlog::info("[connection_pool] Destroyed ({} connections closed)", active.size());
  }

  [[nodiscard]] auto is_destroyed() const -> bool { return destroyed_; }

  /**
   * @brief Retires stale connections and dials for relays past the attempt cap.
   *
   * @param now Reference time, defaults to the system clock
   * @return Number of connections and dials removed
   */
  auto force_cleanup(clock::time_point now = clock::now()) -> std::size_t
  {
    std::vector<std::string> stale;
    for (const auto &[url, connection] : active_) {
      const auto status = registry_.find(url);
      if (status and status->last_connected_at
          and now - *status->last_connected_at > config_.stale_connection_threshold) {
        stale.push_back(url);
      }
    }
    for (const auto &url : stale) {
      auto connection = active_.at(url);
      active_.erase(url);
      registry_.mark_disconnected(url);
      connection->close();
    }

    std::vector<std::string> exhausted;
    for (const auto &[url, dial] : in_flight_) {
      if (registry_.attempts(url) >= config_.max_reconnect_attempts) { exhausted.push_back(url); }
    }
    for (const auto &url : exhausted) {
      auto dial = in_flight_.at(url);
      in_flight_.erase(url);
      abandon(dial,
        std::make_exception_ptr(core::max_attempts_exceeded(url, config_.max_reconnect_attempts)));
    }

    const auto removed = stale.size() + exhausted.size();
    if (removed > 0) { spdlog::info("[connection_pool] Cleanup removed {} connections", removed); }
    return removed;
  }

  /**
   * @brief Zeroes every attempt counter and cancels scheduled reconnects.
   *
   * Dials already in flight are left to finish.
   */
  auto reset_connection_attempts() -> void
  {
    registry_.reset_attempts();
    for (const auto &[url, timer] : reconnect_timers_) { timer->cancel(); }
    reconnect_timers_.clear();
  }

  [[nodiscard]] auto get_connection_statuses() const -> std::vector<connection_status> { return registry_.statuses(); }

  [[nodiscard]] auto get_connection_status(const std::string &url) const -> std::optional<connection_status>
  {
    return registry_.find(nostr::normalize_relay_url(url));
  }

  [[nodiscard]] auto is_connected(const std::string &url) const -> bool
  {
    auto iter = active_.find(nostr::normalize_relay_url(url));
    return iter != active_.end() and iter->second->is_open();
  }

  [[nodiscard]] auto get_connected_relays() const -> std::vector<std::string>
  {
    std::vector<std::string> urls;
    for (const auto &[url, connection] : active_) {
      if (connection->is_open()) { urls.push_back(url); }
    }
    std::ranges::sort(urls);
    return urls;
  }

  [[nodiscard]] auto get_connection_stats() const -> connection_stats
  {
    connection_stats stats{ .total = registry_.size(), .pending = in_flight_.size(), .statuses = registry_.statuses() };
    for (const auto &status : stats.statuses) {
      if (status.connected) {
        ++stats.active;
      } else if (status.last_error) {
        ++stats.failed;
      }
    }
    return stats;
  }

  [[nodiscard]] auto pending_reconnects() const -> std::size_t { return reconnect_timers_.size(); }

private:
  struct pending_dial
  {
    explicit pending_dial(const boost::asio::any_io_executor &executor) : done(executor) {}

    async::notifier done;
    boost::asio::cancellation_signal cancel;
    std::shared_ptr<Connection> connection;
    std::exception_ptr error;
    bool abandoned{ false };
  };

  struct live_subscription
  {
    std::vector<std::string> urls;
    std::vector<nostr::protocol::filter> filters;
    nostr::protocol::event_callback on_event;
    std::unordered_map<std::string, std::weak_ptr<Connection>> attached;///< Session each relay's REQ went to
    std::unordered_set<std::string> seen;
    std::deque<std::string> seen_order;
    bool closed{ false };
  };

  static constexpr std::size_t max_seen_ids = 4096;

  std::shared_ptr<boost::asio::io_context> io_context_;
  connection_factory factory_;
  pool_config config_;
  connection_registry registry_;
  std::unordered_map<std::string, std::shared_ptr<Connection>> active_;
  std::unordered_map<std::string, std::shared_ptr<pending_dial>> in_flight_;
  std::unordered_map<std::string, std::shared_ptr<boost::asio::steady_timer>> reconnect_timers_;
  std::unordered_map<std::string, std::shared_ptr<live_subscription>> subscriptions_;
  boost::asio::steady_timer health_timer_;
  bool health_running_{ false };
  bool foreground_{ true };
  bool destroyed_{ false };

  static auto normalize_all(const std::vector<std::string> &urls) -> std::vector<std::string>
  {
    std::vector<std::string> keys;
    for (const auto &url : urls) {
      auto key = nostr::normalize_relay_url(url);
      if (std::ranges::find(keys, key) == keys.end()) { keys.push_back(std::move(key)); }
    }
    return keys;
  }

  auto find_or_start_dial(const std::string &key) -> std::shared_ptr<pending_dial>
  {
    if (auto iter = in_flight_.find(key); iter != in_flight_.end()) {
      spdlog::trace("[connection_pool] Joining in-flight dial to {}", key);
      return iter->second;
    }

    if (active_.size() + in_flight_.size() >= config_.max_connections) {
      throw core::connection_limit_exceeded(key, config_.max_connections);
    }

    const auto attempts = registry_.attempts(key);
    if (attempts >= config_.max_reconnect_attempts) { throw core::max_attempts_exceeded(key, attempts); }

    auto dial = std::make_shared<pending_dial>(io_context_->get_executor());
    in_flight_[key] = dial;

    boost::asio::co_spawn(*io_context_,
      establish(key, dial),
      boost::asio::bind_cancellation_slot(dial->cancel.slot(),
        [self = this->shared_from_this(), key, dial](
          const std::exception_ptr &error) { self->finish_dial(key, dial, error); }));

    return dial;
  }

  auto establish(std::string key, std::shared_ptr<pending_dial> dial) -> boost::asio::awaitable<void>
  {
    auto self = this->shared_from_this();
    auto connection = factory_(key);
    dial->connection = connection;
    co_await async::with_timeout<core::connection_timeout>(connection->async_connect(), config_.connection_timeout, key);
  }

  auto finish_dial(const std::string &key, const std::shared_ptr<pending_dial> &dial, const std::exception_ptr &error)
    -> void
  {
    if (dial->abandoned) {
      if (dial->connection) { dial->connection->close(); }
      return;
    }

    if (auto iter = in_flight_.find(key); iter != in_flight_.end() and iter->second == dial) { in_flight_.erase(iter); }

    if (error) {
      const auto message = core::describe(error);
      const auto attempts = registry_.record_failure(key, message);
      spdlog::warn("[connection_pool] Connection to {} failed ({}/{}): {}",
        key,
        attempts,
        config_.max_reconnect_attempts,
        message);
      if (dial->connection) { dial->connection->close(); }
      dial->connection.reset();
      dial->error = error;
    } else {
      registry_.mark_connected(key, clock::now());
      active_[key] = dial->connection;
      spdlog::info("[connection_pool] Connected to {} ({} active)", key, active_.size());
      attach_subscriptions(key, dial->connection);
    }

    dial->done.notify();
  }

  auto abandon(const std::shared_ptr<pending_dial> &dial, std::exception_ptr reason) -> void
  {
    dial->abandoned = true;
    dial->error = std::move(reason);
    dial->done.notify();
    dial->cancel.emit(boost::asio::cancellation_type::terminal);
  }

  auto query_relay(std::string key, nostr::protocol::filter filter)
    -> boost::asio::awaitable<std::vector<nostr::protocol::event_data>>
  {
    auto self = this->shared_from_this();
    auto connection = co_await get_connection(key);
    co_return co_await connection->async_query(std::move(filter), config_.relay_query_timeout);
  }

  auto publish_relay(std::string key, nostr::protocol::event_data event) -> boost::asio::awaitable<nostr::protocol::ok>
  {
    auto self = this->shared_from_this();
    auto connection = co_await get_connection(key);
    co_return co_await connection->async_publish(std::move(event), config_.publish_timeout);
  }

  auto spawn_attach(const std::string &id, const std::string &key) -> void
  {
    boost::asio::co_spawn(*io_context_,
      get_connection(key),
      [self = this->shared_from_this(), id, key](
        const std::exception_ptr &failure, const std::shared_ptr<Connection> &connection) {
        if (failure) {
          self->handle_attach_failure(id, key, failure);
          return;
        }
        self->attach(id, key, connection);
      });
  }

  auto handle_attach_failure(const std::string &id, const std::string &key, const std::exception_ptr &failure) -> void
  {
    if (destroyed_ or not subscriptions_.contains(id)) { return; }
    spdlog::warn("[connection_pool] Subscription {} could not reach {}: {}", id, key, core::describe(failure));
    if (core::is_transient(failure) and registry_.attempts(key) < config_.max_reconnect_attempts) {
      schedule_reconnect(key);
    }
  }

  // Sends the REQ unless this session already carries it
  auto attach(const std::string &id, const std::string &key, const std::shared_ptr<Connection> &connection) -> void
  {
    auto iter = subscriptions_.find(id);
    if (iter == subscriptions_.end() or not connection or not connection->is_open()) { return; }
    auto entry = iter->second;
    if (entry->attached[key].lock() == connection) { return; }

    entry->attached[key] = connection;
    connection->subscribe(id, entry->filters, [weak_entry = std::weak_ptr(entry)](const nostr::protocol::event_data &event) {
      auto target = weak_entry.lock();
      if (not target or target->closed or not remember(*target, event.id)) { return; }
      target->on_event(event);
    });
    spdlog::debug("[connection_pool] Subscription {} attached to {}", id, key);
  }

  auto attach_subscriptions(const std::string &key, const std::shared_ptr<Connection> &connection) -> void
  {
    std::vector<std::string> ids;
    for (const auto &[id, entry] : subscriptions_) {
      if (std::ranges::find(entry->urls, key) != entry->urls.end()) { ids.push_back(id); }
    }
    for (const auto &id : ids) { attach(id, key, connection); }
  }

  static auto remember(live_subscription &entry, const std::string &event_id) -> bool
  {
    if (not entry.seen.insert(event_id).second) { return false; }
    entry.seen_order.push_back(event_id);
    if (entry.seen_order.size() > max_seen_ids) {
      entry.seen.erase(entry.seen_order.front());
      entry.seen_order.pop_front();
    }
    return true;
  }

  auto handle_connection_failure(const std::string &url, const std::string &reason) -> void
  {
    if (auto iter = active_.find(url); iter != active_.end()) {
      auto connection = iter->second;
      active_.erase(iter);
      connection->close();
    }

    const auto attempts = registry_.record_failure(url, reason);
    if (attempts < config_.max_reconnect_attempts) {
      spdlog::info("[connection_pool] {} failed ({}), reconnecting in {}ms",
        url,
        reason,
        config_.reconnect_delay.count());
      schedule_reconnect(url);
    } else {
      spdlog::warn("[connection_pool] {} failed ({}), giving up after {} attempts", url, reason, attempts);
    }
  }

  auto schedule_reconnect(const std::string &url) -> void
  {
    if (destroyed_ or reconnect_timers_.contains(url)) { return; }

    auto timer = std::make_shared<boost::asio::steady_timer>(*io_context_, config_.reconnect_delay);
    reconnect_timers_[url] = timer;

    timer->async_wait([self = this->shared_from_this(), url, timer](const boost::system::error_code &error) {
      auto iter = self->reconnect_timers_.find(url);
      if (iter != self->reconnect_timers_.end() and iter->second == timer) { self->reconnect_timers_.erase(iter); }
      if (error or self->destroyed_) { return; }

      boost::asio::co_spawn(*self->io_context_,
        self->get_connection(url),
        [self, url](const std::exception_ptr &failure, const std::shared_ptr<Connection> & /*connection*/) {
          if (failure) {
            spdlog::warn("[connection_pool] Reconnect to {} failed: {}", url, core::describe(failure));
            self->retry_for_subscriptions(url, failure);
          } else {
            spdlog::info("[connection_pool] Reconnected to {}", url);
          }
        });
    });
  }

  // Live subscriptions keep a relay on the reconnect schedule until the attempt cap
  auto retry_for_subscriptions(const std::string &url, const std::exception_ptr &failure) -> void
  {
    if (destroyed_ or not core::is_transient(failure)) { return; }
    const auto wanted = std::ranges::any_of(subscriptions_, [&url](const auto &item) {
      return std::ranges::find(item.second->urls, url) != item.second->urls.end();
    });
    if (wanted and registry_.attempts(url) < config_.max_reconnect_attempts) { schedule_reconnect(url); }
  }

  auto cancel_reconnect(const std::string &url) -> void
  {
    if (auto iter = reconnect_timers_.find(url); iter != reconnect_timers_.end()) {
      iter->second->cancel();
      reconnect_timers_.erase(iter);
    }
  }

  auto health_loop() -> boost::asio::awaitable<void>
  {
    auto self = this->shared_from_this();
    while (not destroyed_) {
      boost::system::error_code error;
      health_timer_.expires_after(config_.effective_health_check_interval());
      co_await health_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));
      if (error or destroyed_) { break; }

      try {
        check_health();
      } catch (const std::exception &e) {
        spdlog::warn("[connection_pool] Health check failed: {}", e.what());
      }
    }
    health_running_ = false;
    spdlog::debug("[connection_pool] Health loop stopped");
  }
};

}// namespace relay_feed::pool
