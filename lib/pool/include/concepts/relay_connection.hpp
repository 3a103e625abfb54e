#pragma once

#include <nostr/protocol.hpp>

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <concepts>
#include <string>
#include <vector>

namespace relay_feed::concepts {

/**
 * @brief A pooled relay session.
 */
template<typename T>
concept relay_connection = requires(T &conn,
  const nostr::protocol::filter &filter,
  const nostr::protocol::event_data &event,
  std::chrono::milliseconds timeout,
  const std::string &subscription_id,
  const std::vector<nostr::protocol::filter> &filters,
  const nostr::protocol::event_callback &on_event) {
  { conn.async_connect() } -> std::same_as<boost::asio::awaitable<void>>;
  { conn.async_query(filter, timeout) } -> std::same_as<boost::asio::awaitable<std::vector<nostr::protocol::event_data>>>;
  { conn.async_publish(event, timeout) } -> std::same_as<boost::asio::awaitable<nostr::protocol::ok>>;
  { conn.subscribe(subscription_id, filters, on_event) } -> std::same_as<void>;
  { conn.unsubscribe(subscription_id) } -> std::same_as<void>;
  { conn.is_open() } -> std::convertible_to<bool>;
  { conn.close() } -> std::same_as<void>;
};

}// namespace relay_feed::concepts
