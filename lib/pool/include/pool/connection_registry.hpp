#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relay_feed::pool {

using clock = std::chrono::system_clock;

/**
 * @brief Diagnostic record kept for every relay the pool has tried to reach.
 */
struct connection_status
{
  std::string url;///< Normalized relay URL
  bool connected{ false };///< Whether a live connection is held
  std::optional<clock::time_point> last_connected_at;///< Last successful handshake
  std::optional<std::string> last_error;///< Most recent failure message
  int connection_attempts{ 0 };///< Consecutive failed connects
  std::optional<clock::time_point> last_health_check_at;///< Last health check
};

/**
 * @brief Per-relay connection bookkeeping.
 *
 * Pure state with no I/O. Records are created lazily and only removed by
 * clear(). Only the connection pool writes to it.
 */
class connection_registry
{
public:
  /**
   * @brief Returns the record for url, creating it when missing.
   */
  auto ensure(const std::string &url) -> connection_status &;

  [[nodiscard]] auto find(const std::string &url) const -> std::optional<connection_status>;

  [[nodiscard]] auto contains(const std::string &url) const -> bool { return statuses_.contains(url); }

  /**
   * @brief Records a successful connect: resets attempts and clears the last error.
   */
  auto mark_connected(const std::string &url, clock::time_point now) -> void;

  auto mark_disconnected(const std::string &url) -> void;

  /**
   * @brief Records a failed connect or health check.
   *
   * @return The attempt count after incrementing
   */
  auto record_failure(const std::string &url, const std::string &error) -> int;

  auto record_health_check(const std::string &url, clock::time_point now) -> void;

  /**
   * @brief Zeroes every attempt counter and clears every last error.
   */
  auto reset_attempts() -> void;

  [[nodiscard]] auto attempts(const std::string &url) const -> int;

  /// All records, ordered by URL
  [[nodiscard]] auto statuses() const -> std::vector<connection_status>;

  [[nodiscard]] auto connected_urls() const -> std::vector<std::string>;

  [[nodiscard]] auto size() const -> std::size_t { return statuses_.size(); }

  auto clear() -> void { statuses_.clear(); }

private:
  std::map<std::string, connection_status> statuses_;
};

}// namespace relay_feed::pool
