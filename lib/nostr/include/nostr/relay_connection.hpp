#pragma once

#include <async/notifier.hpp>
#include <concepts/websocket_stream.hpp>
#include <core/errors.hpp>
#include <core/uuid_generator.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_url.hpp>
#include <nostr/request_tracker.hpp>

#include <boost/asio.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <bit>
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace relay_feed::nostr {

/**
 * @brief One live session with a relay.
 *
 * Bridges the callback-style WebSocket stream into coroutines: REQ/EOSE
 * round-trips for queries and EVENT/OK round-trips for publishes. Must be
 * owned by a std::shared_ptr since the read loop keeps the session alive.
 *
 * @tparam WebSocketStream Stream satisfying concepts::websocket_stream
 */
template<concepts::websocket_stream WebSocketStream>
class relay_connection : public std::enable_shared_from_this<relay_connection<WebSocketStream>>
{
public:
  static constexpr std::size_t read_buffer_size = 1024 * 1024;

  relay_connection(std::string url,
    std::shared_ptr<WebSocketStream> websocket_stream,// NOLINT(modernize-pass-by-value)
    std::shared_ptr<boost::asio::io_context> io_context)// NOLINT(modernize-pass-by-value)
    : url_(std::move(url)), ws_(websocket_stream), io_context_(io_context),// NOLINT(performance-unnecessary-value-param)
      read_buffer_(read_buffer_size)
  {}

  relay_connection(const relay_connection &) = delete;
  auto operator=(const relay_connection &) -> relay_connection & = delete;
  relay_connection(relay_connection &&) = delete;
  auto operator=(relay_connection &&) -> relay_connection & = delete;
  ~relay_connection() = default;

  [[nodiscard]] auto url() const -> const std::string & { return url_; }

  [[nodiscard]] auto is_open() const -> bool { return open_; }

  /**
   * @brief Performs the WebSocket handshake and starts the read loop.
   *
   * @throws core::connection_failed on transport errors or an invalid URL
   * @throws boost::system::system_error (operation_aborted) when cancelled; a
   *         handshake that completes afterwards is closed immediately
   */
  auto async_connect() -> boost::asio::awaitable<void>
  {
    auto endpoint = parse_relay_endpoint(url_);
    if (not endpoint) { throw core::connection_failed(url_, "invalid relay URL"); }

    auto self = this->shared_from_this();
    auto executor = co_await boost::asio::this_coro::executor;
    auto done = std::make_shared<async::notifier>(executor);
    auto result = std::make_shared<boost::system::error_code>();

    spdlog::debug("[relay_connection] Connecting to {}", url_);
    ws_->async_connect({ .host = endpoint->host, .port = endpoint->port, .path = endpoint->path },
      [self, done, result](const boost::system::error_code &error_code, std::size_t /*bytes*/) {
        *result = error_code;
        if (not error_code and self->connect_abandoned_) {
          spdlog::debug("[relay_connection] Late handshake for {}, closing", self->url_);
          self->ws_->async_close([self](const boost::system::error_code & /*error*/, std::size_t /*bytes*/) {});
        }
        done->notify();
      });

    if (co_await done->wait() != async::wait_status::notified) {
      connect_abandoned_ = true;
      throw boost::system::system_error(boost::asio::error::operation_aborted);
    }

    if (*result) { throw core::connection_failed(url_, result->message()); }

    open_ = true;
    spdlog::info("[relay_connection] Connected to {}", url_);
    start_read();
  }

  /**
   * @brief Runs one REQ until EOSE and returns every event received.
   *
   * A CLOSE is sent once the subscription ends. When the relay stalls or
   * drops the subscription after sending some events, those events are
   * returned instead of an error.
   *
   * @param filter Subscription filter
   * @param timeout Maximum wait for EOSE
   * @throws core::query_timeout when nothing arrived before the timeout
   * @throws core::query_failed when the session is closed or the relay refused the subscription
   */
  auto async_query(protocol::filter filter, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::vector<protocol::event_data>>
  {
    if (not open_) { throw core::query_failed(fmt::format("{} is not connected", url_)); }

    auto self = this->shared_from_this();
    const auto subscription_id = core::uuid_generator::subscription_id("q");
    collected_[subscription_id] = {};

    send(protocol::req{ .subscription_id = subscription_id, .filters = { std::move(filter) } }.serialize());

    std::exception_ptr failure;
    try {
      co_await tracker_.async_track<protocol::eose>(subscription_id, timeout);
    } catch (const std::exception &) {
      failure = std::current_exception();
    }

    auto events = std::move(collected_[subscription_id]);
    collected_.erase(subscription_id);
    if (open_) { send(protocol::close{ .subscription_id = subscription_id }.serialize()); }

    if (failure) {
      if (events.empty() or not core::is_transient(failure)) { std::rethrow_exception(failure); }
      spdlog::debug(
        "[relay_connection] {} returned {} events before: {}", url_, events.size(), core::describe(failure));
    }

    co_return events;
  }

  /**
   * @brief Sends a signed event and waits for the relay's OK.
   *
   * @throws core::connection_failed when the session is closed
   * @throws core::query_timeout when no OK arrives in time
   */
  auto async_publish(protocol::event_data event, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<protocol::ok>
  {
    if (not open_) { throw core::connection_failed(url_, "not connected"); }

    auto self = this->shared_from_this();
    const auto event_id = event.id;
    send(protocol::event::from_event_data(event).serialize());

    co_return co_await tracker_.async_track<protocol::ok>(event_id, timeout);
  }

  /**
   * @brief Opens a long-lived subscription that stays active after EOSE.
   *
   * Every event the relay delivers for subscription_id is passed to on_event
   * until unsubscribe(), a CLOSED from the relay, or the session ending.
   *
   * @throws core::connection_failed when the session is closed
   */
  auto subscribe(std::string subscription_id,
    std::vector<protocol::filter> filters,
    protocol::event_callback on_event) -> void
  {
    if (not open_) { throw core::connection_failed(url_, "not connected"); }
    live_[subscription_id] = std::move(on_event);
    send(protocol::req{ .subscription_id = subscription_id, .filters = std::move(filters) }.serialize());
    spdlog::debug("[relay_connection] Subscribed {} on {}", subscription_id, url_);
  }

  /// Sends CLOSE for a live subscription. Unknown IDs are ignored.
  auto unsubscribe(const std::string &subscription_id) -> void
  {
    if (live_.erase(subscription_id) == 0) { return; }
    if (open_) { send(protocol::close{ .subscription_id = subscription_id }.serialize()); }
  }

  [[nodiscard]] auto live_subscriptions() const -> std::size_t { return live_.size(); }

  /**
   * @brief Closes the session and fails every outstanding request. Idempotent.
   */
  auto close() -> void
  {
    if (not open_) { return; }
    open_ = false;
    outbox_.clear();
    live_.clear();
    tracker_.fail_all_pending(fmt::format("connection to {} closed", url_));

    auto self = this->shared_from_this();
    ws_->async_close([self](const boost::system::error_code &error, std::size_t /*bytes*/) {
      if (error) { spdlog::debug("[relay_connection] Close of {} reported: {}", self->url_, error.message()); }
    });
    spdlog::debug("[relay_connection] Closed {}", url_);
  }

private:
  std::string url_;
  std::shared_ptr<WebSocketStream> ws_;
  std::shared_ptr<boost::asio::io_context> io_context_;
  std::vector<std::byte> read_buffer_;
  std::deque<std::shared_ptr<std::string>> outbox_;
  bool writing_{ false };
  bool open_{ false };
  bool connect_abandoned_{ false };
  request_tracker tracker_;
  std::unordered_map<std::string, std::vector<protocol::event_data>> collected_;
  std::unordered_map<std::string, protocol::event_callback> live_;

  auto send(std::string message) -> void
  {
    outbox_.push_back(std::make_shared<std::string>(std::move(message)));
    if (not writing_) { write_next(); }
  }

  // Beast allows a single outstanding write, so frames are queued
  auto write_next() -> void
  {
    if (outbox_.empty() or not open_) {
      writing_ = false;
      return;
    }
    writing_ = true;

    auto data = outbox_.front();
    outbox_.pop_front();

    auto self = this->shared_from_this();
    ws_->async_write(std::as_bytes(std::span(*data)),
      [self, data](const boost::system::error_code &error, std::size_t bytes_transferred) {
        if (error) {
          spdlog::error("[relay_connection] Write to {} failed: {} (attempted {} bytes)",
            self->url_,
            error.message(),
            data->size());
          self->handle_disconnect(error);
          return;
        }
        spdlog::trace("[relay_connection] Wrote {} bytes to {}", bytes_transferred, self->url_);
        self->write_next();
      });
  }

  auto start_read() -> void
  {
    auto self = this->shared_from_this();
    ws_->async_read(boost::asio::buffer(read_buffer_),
      [self](const boost::system::error_code &error, std::size_t bytes_transferred) {
        self->process_read(error, bytes_transferred);
      });
  }

  auto process_read(const boost::system::error_code &error, std::size_t bytes_transferred) -> void
  {
    if (not open_) { return; }

    if (error == boost::asio::error::message_size) {
      start_read();
      return;
    }
    if (error) {
      handle_disconnect(error);
      return;
    }

    if (bytes_transferred > 0) {
      std::string frame(bytes_transferred, '\0');
      std::ranges::transform(read_buffer_.begin(),
        read_buffer_.begin() + static_cast<std::ptrdiff_t>(bytes_transferred),
        frame.begin(),
        [](std::byte byte_val) { return std::bit_cast<char>(byte_val); });
      dispatch(frame);
    }

    if (open_) { start_read(); }
  }

  auto handle_disconnect(const boost::system::error_code &error) -> void
  {
    if (not open_) { return; }
    spdlog::warn("[relay_connection] Lost connection to {}: {}", url_, error.message());
    open_ = false;
    writing_ = false;
    outbox_.clear();
    live_.clear();
    tracker_.fail_all_pending(fmt::format("connection to {} lost: {}", url_, error.message()));
  }

  auto dispatch(const std::string &frame) -> void
  {
    auto message = protocol::parse_relay_message(frame);
    if (not message) {
      spdlog::debug("[relay_connection] Ignoring malformed frame from {}", url_);
      return;
    }
    std::visit([this](auto &&msg) { handle(std::forward<decltype(msg)>(msg)); }, std::move(*message));
  }

  auto handle(protocol::event &&msg) -> void
  {
    if (auto iter = collected_.find(msg.subscription_id); iter != collected_.end()) {
      iter->second.push_back(std::move(msg.data));
      return;
    }
    // Copied so the callback may unsubscribe itself
    if (auto iter = live_.find(msg.subscription_id); iter != live_.end()) {
      auto on_event = iter->second;
      on_event(msg.data);
    }
  }

  auto handle(protocol::eose &&msg) -> void
  {
    if (live_.contains(msg.subscription_id)) {
      spdlog::debug("[relay_connection] {} caught up on {}", url_, msg.subscription_id);
      return;
    }
    tracker_.resolve(msg.subscription_id, msg);
  }

  auto handle(protocol::ok &&msg) -> void
  {
    if (not msg.accepted) { spdlog::debug("[relay_connection] {} rejected {}: {}", url_, msg.event_id, msg.message); }
    tracker_.resolve(msg.event_id, msg);
  }

  auto handle(protocol::closed &&msg) -> void
  {
    spdlog::warn("[relay_connection] {} closed subscription {}: {}", url_, msg.subscription_id, msg.message);
    if (live_.erase(msg.subscription_id) > 0) { return; }
    tracker_.fail(msg.subscription_id, fmt::format("{} closed subscription: {}", url_, msg.message));
  }

  auto handle(protocol::notice &&msg) -> void { spdlog::info("[relay_connection] NOTICE from {}: {}", url_, msg.message); }
};

}// namespace relay_feed::nostr
