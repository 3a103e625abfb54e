#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <pool/connection_registry.hpp>

namespace relay_feed::pool {

/**
 * @brief Tuning for connection_pool.
 *
 * The connection timeout is deliberately shorter than the per-relay request
 * timeouts so that unreachable relays surface quickly.
 */
struct pool_config
{
  std::size_t max_connections{ 20 };///< Active plus in-flight connections
  std::chrono::milliseconds connection_timeout{ 5000 };///< Handshake timeout per attempt
  std::chrono::milliseconds reconnect_delay{ 5000 };///< Delay before a background reconnect
  int max_reconnect_attempts{ 3 };///< Consecutive failures before a relay is refused
  std::chrono::milliseconds relay_query_timeout{ 10000 };///< Per-relay wait for EOSE
  std::chrono::milliseconds publish_timeout{ 10000 };///< Per-relay wait for OK
  std::chrono::milliseconds health_check_interval{ 60000 };
  std::chrono::milliseconds constrained_health_check_interval{ 90000 };
  std::chrono::milliseconds stale_connection_threshold{ std::chrono::minutes(5) };
  bool resource_constrained{ false };///< Selects the longer health check interval

  [[nodiscard]] auto effective_health_check_interval() const -> std::chrono::milliseconds
  {
    return resource_constrained ? constrained_health_check_interval : health_check_interval;
  }
};

/**
 * @brief Snapshot returned by connection_pool::get_connection_stats().
 */
struct connection_stats
{
  std::size_t total{};///< Relays with a registry record
  std::size_t active{};///< Relays currently connected
  std::size_t failed{};///< Disconnected relays whose last attempt failed
  std::size_t pending{};///< Dials in flight
  std::vector<connection_status> statuses;
};

}// namespace relay_feed::pool
