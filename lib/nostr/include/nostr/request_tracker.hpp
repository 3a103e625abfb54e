#pragma once

#include <async/notifier.hpp>
#include <core/errors.hpp>
#include <nostr/protocol.hpp>

#include <any>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay_feed::nostr {

/**
 * @brief Matches relay responses to the coroutines waiting for them.
 *
 * Keys are event IDs for OK responses and subscription IDs for EOSE. Several
 * waiters may share an ID; a response completes all of them, while a timeout
 * or cancellation only removes its own waiter.
 */
class request_tracker
{
private:
  /// Internal structure for pending request state
  struct pending_request
  {
    std::function<void(const std::any &)> complete;///< Delivers the response
    std::function<void(const std::string &)> fail;///< Delivers a failure reason
    std::uint64_t token{};///< Distinguishes waiters sharing one ID
  };

  template<typename ResponseType> struct track_state
  {
    explicit track_state(const boost::asio::any_io_executor &executor) : done(executor) {}

    async::notifier done;
    std::optional<ResponseType> response;
    std::optional<std::string> failure;
  };

public:
  request_tracker() = default;

  /**
   * @brief Checks if an ID has a pending request.
   *
   * @param request_id Event or subscription ID
   * @return true if pending, false otherwise
   */
  [[nodiscard]] auto has_pending(const std::string &request_id) const -> bool { return pending_.contains(request_id); }

  /// Number of waiting coroutines across all IDs
  [[nodiscard]] auto pending_count() const -> std::size_t
  {
    std::size_t count = 0;
    for (const auto &[request_id, waiters] : pending_) { count += waiters.size(); }
    return count;
  }

  /**
   * @brief Resolves a pending request with a response.
   *
   * Responses of a different type than the waiter expects are ignored.
   *
   * @tparam ResponseType Type of response (ok or eose)
   * @param request_id ID to resolve
   * @param response Response data
   */
  template<typename ResponseType> auto resolve(const std::string &request_id, const ResponseType &response) -> void
  {
    auto iter = pending_.find(request_id);
    if (iter == pending_.end()) { return; }

    auto waiters = std::move(iter->second);
    pending_.erase(iter);
    const std::any payload(response);
    for (auto &request : waiters) { request.complete(payload); }
  }

  /**
   * @brief Fails one pending request.
   *
   * @param request_id ID to fail
   * @param reason Surfaced to the waiter as core::query_failed
   */
  auto fail(const std::string &request_id, const std::string &reason) -> void
  {
    auto iter = pending_.find(request_id);
    if (iter == pending_.end()) { return; }

    auto waiters = std::move(iter->second);
    pending_.erase(iter);
    for (auto &request : waiters) { request.fail(reason); }
  }

  /**
   * @brief Fails every pending request, e.g. when the connection drops.
   *
   * @param reason Surfaced to each waiter as core::query_failed
   */
  auto fail_all_pending(const std::string &reason) -> void
  {
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto &[request_id, waiters] : pending) {
      for (auto &request : waiters) { request.fail(reason); }
    }
  }

  /**
   * @brief Waits for the response to a request.
   *
   * @tparam ResponseType Type of response to await (ok or eose)
   * @param request_id Event or subscription ID to track
   * @param timeout Maximum time to wait for response
   * @return Awaitable that yields the response
   * @throws core::query_timeout on timeout
   * @throws core::query_failed when the request is failed
   * @throws boost::system::system_error (operation_aborted) when the waiter is cancelled
   */
  template<typename ResponseType = protocol::ok>
  [[nodiscard]] auto async_track(std::string request_id, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<ResponseType>
  {
    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<track_state<ResponseType>>(executor);

    const auto token = next_token_++;
    pending_[request_id].push_back(pending_request{ .complete =
                                                      [state](const std::any &response_any) {
                                                        if (const auto *response =
                                                              std::any_cast<ResponseType>(&response_any)) {
                                                          state->response = *response;
                                                        }
                                                        state->done.notify();
                                                      },
      .fail =
        [state](const std::string &reason) {
          state->failure = reason;
          state->done.notify();
        },
      .token = token });

    const auto status = co_await state->done.wait(timeout);

    if (status != async::wait_status::notified) { remove_waiter(request_id, token); }

    if (status == async::wait_status::timed_out) {
      throw core::query_timeout(fmt::format("Request timeout for {}", request_id));
    }
    if (status == async::wait_status::cancelled) {
      throw boost::system::system_error(boost::asio::error::operation_aborted);
    }
    if (state->failure) { throw core::query_failed(*state->failure); }
    if (not state->response) { throw core::query_failed(fmt::format("Unexpected response for {}", request_id)); }

    co_return std::move(*state->response);
  }

private:
  std::unordered_map<std::string, std::vector<pending_request>> pending_;
  std::uint64_t next_token_{ 1 };

  auto remove_waiter(const std::string &request_id, std::uint64_t token) -> void
  {
    auto iter = pending_.find(request_id);
    if (iter == pending_.end()) { return; }
    std::erase_if(iter->second, [token](const pending_request &request) { return request.token == token; });
    if (iter->second.empty()) { pending_.erase(iter); }
  }
};

}// namespace relay_feed::nostr
