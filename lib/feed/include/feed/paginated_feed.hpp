#pragma once

#include <async/sleep.hpp>
#include <async/timeout.hpp>
#include <concepts/relay_query_client.hpp>
#include <core/errors.hpp>
#include <feed/content_filter.hpp>
#include <feed/failure_tracker.hpp>
#include <feed/feed_aggregate.hpp>
#include <feed/feed_options.hpp>
#include <feed/pagination.hpp>
#include <nostr/protocol.hpp>
#include <platform/time_utils.hpp>
#include <throttle/query_throttle.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relay_feed::feed {

enum class feed_state {
  idle,
  fetching_first_page,
  ready,
  fetching_next_page,
  exhausted,
};

[[nodiscard]] inline auto to_string(feed_state state) -> std::string_view
{
  switch (state) {
  case feed_state::idle:
    return "idle";
  case feed_state::fetching_first_page:
    return "fetching_first_page";
  case feed_state::ready:
    return "ready";
  case feed_state::fetching_next_page:
    return "fetching_next_page";
  case feed_state::exhausted:
    return "exhausted";
  }
  return "unknown";
}

/**
 * @brief Pull-based, time-windowed pagination over a set of relays.
 *
 * Pages are strictly sequential: each next_page() builds its window from the
 * previous page's cursor. Each page fetch holds a feed throttle slot for all
 * of its attempts, races every attempt against a shape-dependent timeout and
 * backs off between attempts. Broad queries that keep failing transiently
 * yield an empty soft-failed page so the feed keeps moving; narrow ones
 * surface the typed error.
 *
 * @tparam Client Type satisfying concepts::relay_query_client
 */
template<concepts::relay_query_client Client>
class paginated_feed : public std::enable_shared_from_this<paginated_feed<Client>>
{
public:
  using clock_fn = std::function<std::uint64_t()>;

  paginated_feed(std::shared_ptr<Client> client,
    std::shared_ptr<throttle::query_throttle> throttle,
    std::shared_ptr<failure_tracker> failures,
    std::vector<std::string> relays,
    nostr::protocol::filter base_filter,
    feed_options options = {},
    content_filter filter = content_filter{})
    : client_(std::move(client)), throttle_(std::move(throttle)), failures_(std::move(failures)),
      relays_(std::move(relays)), base_filter_(std::move(base_filter)), options_(std::move(options)),
      content_filter_(std::move(filter)), shape_(classify(base_filter_, options_.thresholds))
  {}

  paginated_feed(const paginated_feed &) = delete;
  auto operator=(const paginated_feed &) -> paginated_feed & = delete;
  paginated_feed(paginated_feed &&) = delete;
  auto operator=(paginated_feed &&) -> paginated_feed & = delete;
  ~paginated_feed() = default;

  /// Replaces the wall clock, in unix seconds
  auto set_clock(clock_fn clock) -> void { clock_ = std::move(clock); }

  [[nodiscard]] auto state() const -> feed_state { return state_; }
  [[nodiscard]] auto shape() const -> query_shape { return shape_; }
  [[nodiscard]] auto pages() const -> const std::vector<page> & { return pages_; }
  [[nodiscard]] auto relays() const -> const std::vector<std::string> & { return relays_; }
  [[nodiscard]] auto base_filter() const -> const nostr::protocol::filter & { return base_filter_; }
  [[nodiscard]] auto options() const -> const feed_options & { return options_; }
  [[nodiscard]] auto exhausted() const -> bool { return state_ == feed_state::exhausted; }
  [[nodiscard]] auto fetching() const -> bool
  {
    return state_ == feed_state::fetching_first_page or state_ == feed_state::fetching_next_page;
  }
  [[nodiscard]] auto aggregate() const -> const feed_aggregate & { return aggregate_; }

  /// Aggregated events passing the current filter options, newest first
  [[nodiscard]] auto visible_events() const -> std::vector<nostr::protocol::event_data>
  {
    return aggregate_.visible(content_filter_);
  }

  [[nodiscard]] auto filter_options() const -> const feed::filter_options & { return content_filter_.options(); }

  /// Takes effect on the next visible_events() call without refetching
  auto set_filter_options(feed::filter_options options) -> void { content_filter_.set_options(std::move(options)); }

  /**
   * @brief Fetches the next page.
   *
   * @param cancel_slot Optional slot that abandons the fetch when emitted
   * @return The page, or std::nullopt once the feed is exhausted
   * @throws std::logic_error when a fetch is already running
   * @throws core::relay_error subclasses when the page fails hard
   * @throws boost::system::system_error (operation_aborted) when cancelled or
   *         when refresh() ran while the fetch was in flight
   */
  auto next_page(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr)
    -> boost::asio::awaitable<std::optional<page>>
  {
    if (fetching()) {
      throw std::logic_error("paginated_feed: a page fetch is already in progress");
    }
    if (state_ == feed_state::exhausted) { co_return std::nullopt; }

    auto self = this->shared_from_this();
    const bool first = pages_.empty();
    const auto generation = generation_;
    const auto now = clock_();
    const auto window =
      first ? first_page_window(shape_, options_.window, now)
            : next_page_window(shape_, pages_.back().next_cursor, options_.window);
    state_ = first ? feed_state::fetching_first_page : feed_state::fetching_next_page;

    std::optional<page> fetched;
    std::exception_ptr failure;
    try {
      fetched = co_await fetch(window, now, cancel_slot);
    } catch (const std::exception &) {
      failure = std::current_exception();
    }

    if (generation != generation_) {
      spdlog::debug("[paginated_feed] Discarding page fetched before refresh");
      throw boost::system::system_error(boost::asio::error::operation_aborted);
    }

    if (failure) {
      state_ = pages_.empty() ? feed_state::idle : feed_state::ready;
      std::rethrow_exception(failure);
    }

    record(*fetched);
    co_return fetched;
  }

  /**
   * @brief Drops every page and returns to idle.
   *
   * A fetch still in flight completes with operation_aborted and leaves no trace.
   */
  auto refresh() -> void
  {
    ++generation_;
    pages_.clear();
    aggregate_.clear();
    consecutive_empty_ = 0;
    state_ = feed_state::idle;
    spdlog::debug("[paginated_feed] Refreshed {} feed", to_string(shape_));
  }

private:
  std::shared_ptr<Client> client_;
  std::shared_ptr<throttle::query_throttle> throttle_;
  std::shared_ptr<failure_tracker> failures_;
  std::vector<std::string> relays_;
  nostr::protocol::filter base_filter_;
  feed_options options_;
  content_filter content_filter_;
  query_shape shape_;
  clock_fn clock_{ platform::unix_now };

  feed_state state_{ feed_state::idle };
  std::vector<page> pages_;
  feed_aggregate aggregate_;
  std::size_t consecutive_empty_{ 0 };
  std::uint64_t generation_{ 0 };

  auto fetch(page_window window, std::uint64_t now, std::shared_ptr<boost::asio::cancellation_slot> cancel_slot)
    -> boost::asio::awaitable<page>
  {
    if (relays_.empty()) { throw core::no_relays_configured(); }

    auto slot = co_await throttle_->acquire_scoped(throttle::query_category::feed,
      throttle::acquire_options{ .cancel_slot = cancel_slot, .queue_timeout = options_.slot_queue_timeout });

    const auto filter = make_page_filter(base_filter_, window, options_.window.page_size);
    const auto attempts = attempts_for(shape_, options_.retries);
    std::exception_ptr last_error;

    for (int attempt = 0; attempt < attempts; ++attempt) {
      if (attempt > 0) { co_await async::sleep_for(backoff_delay(attempt - 1, options_.retries), cancel_slot); }

      const auto timeout = query_timeout_for(shape_, options_.timeouts, failures_->count());
      std::exception_ptr error;
      std::vector<nostr::protocol::event_data> events;
      try {
        events = co_await async::with_timeout_cancellable<core::query_timeout>(client_->query(relays_, filter),
          timeout,
          cancel_slot,
          fmt::format("Page query timed out after {} ms", timeout.count()));
      } catch (const std::exception &) {
        error = std::current_exception();
      }

      if (error) {
        if (core::is_cancelled(error)) { std::rethrow_exception(error); }
        if (not core::is_transient(error)) {
          failures_->increment();
          std::rethrow_exception(error);
        }
        spdlog::debug("[paginated_feed] {} attempt {}/{} failed: {}",
          to_string(shape_),
          attempt + 1,
          attempts,
          core::describe(error));
        last_error = error;
        continue;
      }

      const bool final_attempt = attempt + 1 == attempts;
      if (events.empty() and options_.retries.retry_empty_results and not final_attempt) {
        spdlog::debug("[paginated_feed] {} attempt {}/{} returned nothing, retrying", to_string(shape_), attempt + 1, attempts);
        last_error = nullptr;
        continue;
      }

      failures_->reset();
      co_return build_page(std::move(events), window, now);
    }

    failures_->increment();
    if (options_.soft_failure.allows(shape_)) {
      spdlog::warn("[paginated_feed] {} page failed after {} attempts, continuing with an empty page: {}",
        to_string(shape_),
        attempts,
        core::describe(last_error));
      co_return soft_failed_page(window, now);
    }

    spdlog::warn("[paginated_feed] {} page failed after {} attempts: {}",
      to_string(shape_),
      attempts,
      core::describe(last_error));
    std::rethrow_exception(last_error);
  }

  auto build_page(std::vector<nostr::protocol::event_data> raw, page_window window, std::uint64_t now) const -> page
  {
    auto events = dedupe_newest_first(std::move(raw));
    const auto requested = window.until > 0 ? std::optional<std::uint64_t>(window.until) : std::nullopt;
    const auto cursor = compute_cursor(events, content_filter_.oldest_visible(events), requested, window.until, now);
    return page{ .events = std::move(events),
      .since = window.since,
      .until = window.until,
      .next_cursor = cursor.next_cursor,
      .requested_until = requested,
      .oldest_seen = cursor.oldest_seen,
      .soft_failed = false };
  }

  auto record(const page &fetched) -> void
  {
    pages_.push_back(fetched);
    aggregate_.add(fetched.events);
    consecutive_empty_ = fetched.events.empty() ? consecutive_empty_ + 1 : 0;

    if (auto reason = exhaustion_reason(fetched)) {
      spdlog::info("[paginated_feed] {} feed exhausted after {} pages: {}", to_string(shape_), pages_.size(), *reason);
      state_ = feed_state::exhausted;
      return;
    }
    state_ = feed_state::ready;
  }

  [[nodiscard]] auto exhaustion_reason(const page &latest) const -> std::optional<std::string>
  {
    const auto &limits = options_.limits;
    if (consecutive_empty_ >= limits.max_consecutive_empty_pages) {
      return fmt::format("{} consecutive empty pages", consecutive_empty_);
    }
    if (pages_.size() >= limits.max_pages) { return fmt::format("reached {} pages", limits.max_pages); }
    if (latest.next_cursor == 0) { return std::string("cursor reached the epoch"); }

    if (limits.maximum_age and pages_.size() > limits.maximum_age_min_pages) {
      const auto now = clock_();
      const auto max_age = static_cast<std::uint64_t>(limits.maximum_age->count());
      const auto cutoff = now > max_age ? now - max_age : 0;
      std::optional<std::uint64_t> oldest;
      // An empty or soft-failed page has still walked back to its upper bound
      for (const auto &fetched : pages_) {
        const auto reached = fetched.events.empty() ? fetched.until : fetched.oldest_seen;
        if (not oldest or reached < *oldest) { oldest = reached; }
      }
      if (oldest and *oldest < cutoff) { return fmt::format("content older than {}", platform::format_unix_timestamp(cutoff)); }
    }
    return std::nullopt;
  }
};

}// namespace relay_feed::feed
