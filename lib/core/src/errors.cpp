#include <core/errors.hpp>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/format.h>

namespace relay_feed::core {

auto to_string(error_kind kind) -> std::string_view
{
  switch (kind) {
  case error_kind::connection_timeout:
    return "connection_timeout";
  case error_kind::connection_limit_exceeded:
    return "connection_limit_exceeded";
  case error_kind::max_attempts_exceeded:
    return "max_attempts_exceeded";
  case error_kind::connection_failed:
    return "connection_failed";
  case error_kind::pool_destroyed:
    return "pool_destroyed";
  case error_kind::throttle_timeout:
    return "throttle_timeout";
  case error_kind::throttle_aborted:
    return "throttle_aborted";
  case error_kind::query_timeout:
    return "query_timeout";
  case error_kind::query_failed:
    return "query_failed";
  case error_kind::publish_failed:
    return "publish_failed";
  case error_kind::no_relays_configured:
    return "no_relays_configured";
  }
  return "unknown";
}

auto to_string(failure_cause cause) -> std::string_view
{
  switch (cause) {
  case failure_cause::timeout:
    return "timeout";
  case failure_cause::network:
    return "network";
  case failure_cause::configuration:
    return "configuration";
  case failure_cause::capacity:
    return "capacity";
  case failure_cause::cancelled:
    return "cancelled";
  }
  return "unknown";
}

auto relay_error::is_transient() const noexcept -> bool
{
  switch (kind_) {
  case error_kind::connection_timeout:
  case error_kind::connection_failed:
  case error_kind::query_timeout:
  case error_kind::query_failed:
    return true;
  default:
    return false;
  }
}

connection_timeout::connection_timeout(const std::string &url)
  : relay_error(error_kind::connection_timeout, failure_cause::timeout, fmt::format("Connection timeout for {}", url))
{}

connection_limit_exceeded::connection_limit_exceeded(const std::string &url, std::size_t limit)
  : relay_error(error_kind::connection_limit_exceeded,
      failure_cause::capacity,
      fmt::format("Connection limit of {} reached, refusing {}", limit, url))
{}

max_attempts_exceeded::max_attempts_exceeded(const std::string &url, int attempts)
  : relay_error(error_kind::max_attempts_exceeded,
      failure_cause::network,
      fmt::format("Max connection attempts ({}) exceeded for {}", attempts, url))
{}

connection_failed::connection_failed(const std::string &url, const std::string &reason)
  : relay_error(error_kind::connection_failed,
      failure_cause::network,
      fmt::format("Connection to {} failed: {}", url, reason))
{}

pool_destroyed::pool_destroyed()
  : relay_error(error_kind::pool_destroyed, failure_cause::configuration, "Connection pool has been destroyed")
{}

throttle_timeout::throttle_timeout(std::string_view category, long long waited_ms)
  : relay_error(error_kind::throttle_timeout,
      failure_cause::timeout,
      fmt::format("Query slot timeout for {} after {} milliseconds", category, waited_ms))
{}

throttle_aborted::throttle_aborted(std::string_view category)
  : relay_error(error_kind::throttle_aborted, failure_cause::cancelled, fmt::format("Query slot aborted for {}", category))
{}

query_timeout::query_timeout(const std::string &message)
  : relay_error(error_kind::query_timeout, failure_cause::timeout, message)
{}

query_failed::query_failed(const std::string &reason)
  : relay_error(error_kind::query_failed, failure_cause::network, fmt::format("Query failed: {}", reason)),
    reason_(reason)
{}

namespace {

  auto format_failures(const std::vector<relay_failure> &failures) -> std::string
  {
    std::string joined;
    for (const auto &failure : failures) {
      if (not joined.empty()) { joined += "; "; }
      joined += fmt::format("{}: {}", failure.url, failure.message);
    }
    return fmt::format("Publish failed: {}", joined);
  }

}// namespace

publish_failed::publish_failed(std::vector<relay_failure> failures)
  : relay_error(error_kind::publish_failed, failure_cause::network, format_failures(failures)),
    failures_(std::move(failures))
{}

no_relays_configured::no_relays_configured()
  : relay_error(error_kind::no_relays_configured, failure_cause::configuration, "No relays configured")
{}

auto describe(const std::exception_ptr &error) -> std::string
{
  if (not error) { return "no error"; }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  }
}

auto is_transient(const std::exception_ptr &error) -> bool
{
  if (not error) { return false; }
  try {
    std::rethrow_exception(error);
  } catch (const relay_error &e) {
    return e.is_transient();
  } catch (const boost::system::system_error &e) {
    return e.code() != boost::asio::error::operation_aborted;
  } catch (const std::exception &) {
    return true;
  }
}

auto is_timeout(const std::exception_ptr &error) -> bool
{
  if (not error) { return false; }
  try {
    std::rethrow_exception(error);
  } catch (const relay_error &e) {
    return e.cause() == failure_cause::timeout;
  } catch (const std::exception &) {
    return false;
  }
}

auto is_cancelled(const std::exception_ptr &error) -> bool
{
  if (not error) { return false; }
  try {
    std::rethrow_exception(error);
  } catch (const relay_error &e) {
    return e.cause() == failure_cause::cancelled;
  } catch (const boost::system::system_error &e) {
    return e.code() == boost::asio::error::operation_aborted;
  } catch (const std::exception &) {
    return false;
  }
}

}// namespace relay_feed::core
