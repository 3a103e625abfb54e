#pragma once

#include <async/notifier.hpp>
#include <throttle/throttle_config.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>

namespace relay_feed::throttle {

/**
 * @brief Proof of admission returned by query_throttle::acquire().
 */
struct slot_token
{
  query_category category{ query_category::feed };
  std::uint64_t id{};///< Unique per throttle instance
  std::chrono::steady_clock::time_point acquired_at;
};

struct acquire_options
{
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot;///< Emitting it removes the queued entry
  std::chrono::milliseconds queue_timeout{ 30000 };
};

/// Per-category snapshot returned by query_throttle::status()
struct category_status
{
  std::size_t active{};
  std::size_t max{};
  std::size_t queued{};
};

class scoped_slot;

/**
 * @brief Category-partitioned counting semaphore with FIFO queues.
 *
 * Each category admits at most its configured number of concurrent holders.
 * Waiters within a category are served in arrival order; when slots free up
 * in several categories at once, categories are served in priority order.
 * Capacity follows effective_config() so that toggling discovery shrinks the
 * feed budget. Shrinking never evicts a held slot; it only delays admission.
 */
class query_throttle : public std::enable_shared_from_this<query_throttle>
{
public:
  explicit query_throttle(const std::shared_ptr<boost::asio::io_context> &io_context,
    throttle_config base = {},
    process_state state = {});

  query_throttle(const query_throttle &) = delete;
  auto operator=(const query_throttle &) -> query_throttle & = delete;
  query_throttle(query_throttle &&) = delete;
  auto operator=(query_throttle &&) -> query_throttle & = delete;
  ~query_throttle() = default;

  /**
   * @brief Waits for a slot in the given category.
   *
   * @throws core::throttle_timeout when the queue timeout elapses first
   * @throws core::throttle_aborted when cancelled or when reset() runs
   */
  auto acquire(query_category category, acquire_options options = {}) -> boost::asio::awaitable<slot_token>;

  /// As acquire(), but the slot is released when the guard is destroyed
  auto acquire_scoped(query_category category, acquire_options options = {}) -> boost::asio::awaitable<scoped_slot>;

  /// Returns a slot and admits waiters. Unknown or already released tokens are ignored.
  auto release(const slot_token &token) -> void;

  auto set_process_state(process_state state) -> void;
  auto set_discovery_active(bool active) -> void;
  auto set_base_config(throttle_config base) -> void;

  /// Drops every held slot and aborts every queued waiter
  auto reset() -> void;

  [[nodiscard]] auto current_config() const -> throttle_config { return effective_config(base_, state_); }
  [[nodiscard]] auto state() const -> const process_state & { return state_; }
  [[nodiscard]] auto active(query_category category) const -> std::size_t;
  [[nodiscard]] auto queued(query_category category) const -> std::size_t;
  [[nodiscard]] auto status() const -> std::map<query_category, category_status>;

private:
  struct waiter
  {
    explicit waiter(boost::asio::any_io_executor executor) : done(std::move(executor)) {}

    query_category category{ query_category::feed };
    async::notifier done;
    std::optional<slot_token> granted;
    bool aborted{ false };
  };

  std::shared_ptr<boost::asio::io_context> io_context_;
  throttle_config base_;
  process_state state_;
  std::uint64_t next_token_id_{ 1 };
  std::deque<std::shared_ptr<waiter>> queue_;// arrival order
  std::unordered_map<std::uint64_t, slot_token> held_;
  std::map<query_category, std::size_t> active_;

  auto grant(query_category category) -> slot_token;
  auto process_queue() -> void;
  auto remove_waiter(const std::shared_ptr<waiter> &entry) -> void;
  auto warn_if_over_capacity() const -> void;
};

/**
 * @brief Move-only guard that releases its slot on destruction.
 */
class scoped_slot
{
public:
  scoped_slot() = default;
  scoped_slot(std::shared_ptr<query_throttle> throttle, slot_token token)
    : throttle_(std::move(throttle)), token_(token)
  {}

  scoped_slot(const scoped_slot &) = delete;
  auto operator=(const scoped_slot &) -> scoped_slot & = delete;

  scoped_slot(scoped_slot &&other) noexcept : throttle_(std::move(other.throttle_)), token_(other.token_)
  {
    other.throttle_.reset();
  }

  auto operator=(scoped_slot &&other) noexcept -> scoped_slot &
  {
    if (this != &other) {
      release();
      throttle_ = std::move(other.throttle_);
      token_ = other.token_;
      other.throttle_.reset();
    }
    return *this;
  }

  ~scoped_slot() { release(); }

  auto release() -> void
  {
    if (throttle_) {
      throttle_->release(token_);
      throttle_.reset();
    }
  }

  [[nodiscard]] auto held() const -> bool { return throttle_ != nullptr; }
  [[nodiscard]] auto token() const -> const slot_token & { return token_; }

private:
  std::shared_ptr<query_throttle> throttle_;
  slot_token token_;
};

}// namespace relay_feed::throttle
