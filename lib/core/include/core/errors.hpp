#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace relay_feed::core {

/**
 * @brief Discriminator for every failure the relay layer reports.
 */
enum class error_kind {
  connection_timeout,///< Transport handshake did not finish in time
  connection_limit_exceeded,///< Pool already holds the maximum number of connections
  max_attempts_exceeded,///< Relay failed too many consecutive connects
  connection_failed,///< Transport reported an error while connecting
  pool_destroyed,///< Operation issued after the pool was torn down
  throttle_timeout,///< Queued too long waiting for a slot
  throttle_aborted,///< Queued entry was cancelled or the throttle was reset
  query_timeout,///< No relay answered a query in time
  query_failed,///< Every relay failed a query for a non-timeout reason
  publish_failed,///< No relay accepted a published event
  no_relays_configured,///< Request addressed to an empty relay list
};

/**
 * @brief Coarse failure cause used to offer targeted retries.
 */
enum class failure_cause {
  timeout,
  network,
  configuration,
  capacity,
  cancelled,
};

[[nodiscard]] auto to_string(error_kind kind) -> std::string_view;
[[nodiscard]] auto to_string(failure_cause cause) -> std::string_view;

/**
 * @brief Base class of the relay error taxonomy.
 */
class relay_error : public std::runtime_error
{
public:
  relay_error(error_kind kind, failure_cause cause, const std::string &message)
    : std::runtime_error(message), kind_(kind), cause_(cause)
  {}

  [[nodiscard]] auto kind() const noexcept -> error_kind { return kind_; }
  [[nodiscard]] auto cause() const noexcept -> failure_cause { return cause_; }

  /**
   * @brief Whether retrying the same request may succeed.
   *
   * @return true for timeouts and transport failures
   */
  [[nodiscard]] auto is_transient() const noexcept -> bool;

private:
  error_kind kind_;
  failure_cause cause_;
};

class connection_timeout : public relay_error
{
public:
  explicit connection_timeout(const std::string &url);
};

class connection_limit_exceeded : public relay_error
{
public:
  connection_limit_exceeded(const std::string &url, std::size_t limit);
};

class max_attempts_exceeded : public relay_error
{
public:
  max_attempts_exceeded(const std::string &url, int attempts);
};

class connection_failed : public relay_error
{
public:
  connection_failed(const std::string &url, const std::string &reason);
};

class pool_destroyed : public relay_error
{
public:
  pool_destroyed();
};

class throttle_timeout : public relay_error
{
public:
  throttle_timeout(std::string_view category, long long waited_ms);
};

class throttle_aborted : public relay_error
{
public:
  explicit throttle_aborted(std::string_view category);
};

class query_timeout : public relay_error
{
public:
  explicit query_timeout(const std::string &message);
};

class query_failed : public relay_error
{
public:
  explicit query_failed(const std::string &reason);

  [[nodiscard]] auto reason() const -> const std::string & { return reason_; }

private:
  std::string reason_;
};

/// Per-relay error collected while publishing
struct relay_failure
{
  std::string url;///< Normalized relay URL
  std::string message;///< What went wrong on that relay
};

class publish_failed : public relay_error
{
public:
  explicit publish_failed(std::vector<relay_failure> failures);

  [[nodiscard]] auto failures() const -> const std::vector<relay_failure> & { return failures_; }

private:
  std::vector<relay_failure> failures_;
};

class no_relays_configured : public relay_error
{
public:
  no_relays_configured();
};

/**
 * @brief Extracts a human readable message from a captured exception.
 */
[[nodiscard]] auto describe(const std::exception_ptr &error) -> std::string;

/**
 * @brief Whether a captured exception is a transient relay error.
 *
 * Exceptions outside the taxonomy count as transient network failures.
 */
[[nodiscard]] auto is_transient(const std::exception_ptr &error) -> bool;

/**
 * @brief Whether a captured exception is a timeout of any category.
 */
[[nodiscard]] auto is_timeout(const std::exception_ptr &error) -> bool;

/**
 * @brief Whether a captured exception reports cancellation rather than failure.
 */
[[nodiscard]] auto is_cancelled(const std::exception_ptr &error) -> bool;

}// namespace relay_feed::core
