#include <throttle/query_throttle.hpp>

#include <core/errors.hpp>

#include <boost/asio/this_coro.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace relay_feed::throttle {

query_throttle::query_throttle(const std::shared_ptr<boost::asio::io_context> &io_context,
  throttle_config base,
  process_state state)
  : io_context_(io_context), base_(std::move(base)), state_(state)
{}

auto query_throttle::acquire(query_category category, acquire_options options) -> boost::asio::awaitable<slot_token>
{
  auto self = shared_from_this();
  const auto config = current_config();

  if (queued(category) == 0 and active(category) < config.max_for(category)) { co_return grant(category); }

  auto entry = std::make_shared<waiter>(co_await boost::asio::this_coro::executor);
  entry->category = category;
  queue_.push_back(entry);
  spdlog::debug("[query_throttle] Queued {} request ({} active, {} waiting)",
    to_string(category),
    active(category),
    queued(category));

  const auto started = std::chrono::steady_clock::now();
  const auto status = co_await entry->done.wait(options.queue_timeout, options.cancel_slot);

  if (entry->granted) {
    if (status != async::wait_status::cancelled) { co_return *entry->granted; }
    // Granted in the same turn the caller gave up; hand the slot back
    release(*entry->granted);
    throw core::throttle_aborted(to_string(category));
  }

  remove_waiter(entry);
  if (entry->aborted or status == async::wait_status::cancelled) { throw core::throttle_aborted(to_string(category)); }

  const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  spdlog::warn("[query_throttle] {} request timed out after {} ms in queue", to_string(category), waited.count());
  throw core::throttle_timeout(to_string(category), static_cast<long long>(waited.count()));
}

auto query_throttle::acquire_scoped(query_category category, acquire_options options)
  -> boost::asio::awaitable<scoped_slot>
{
  auto self = shared_from_this();
  auto token = co_await acquire(category, std::move(options));
  co_return scoped_slot{ self, token };
}

auto query_throttle::release(const slot_token &token) -> void
{
  auto iter = held_.find(token.id);
  if (iter == held_.end()) {
    spdlog::debug("[query_throttle] Ignoring release of unknown slot {}", token.id);
    return;
  }
  held_.erase(iter);
  auto &count = active_[token.category];
  if (count > 0) { --count; }
  process_queue();
}

auto query_throttle::set_process_state(process_state state) -> void
{
  state_ = state;
  spdlog::debug("[query_throttle] Discovery {}, feed capacity {}",
    state_.discovery_active ? "active" : "idle",
    current_config().max_for(query_category::feed));
  warn_if_over_capacity();
  process_queue();
}

auto query_throttle::set_discovery_active(bool active) -> void
{
  set_process_state(process_state{ .discovery_active = active });
}

auto query_throttle::set_base_config(throttle_config base) -> void
{
  base_ = std::move(base);
  warn_if_over_capacity();
  process_queue();
}

auto query_throttle::reset() -> void
{
  spdlog::info("[query_throttle] Reset: dropping {} held slots, aborting {} waiters", held_.size(), queue_.size());
  held_.clear();
  active_.clear();
  auto waiting = std::move(queue_);
  queue_.clear();
  for (const auto &entry : waiting) {
    entry->aborted = true;
    entry->done.notify();
  }
}

auto query_throttle::active(query_category category) const -> std::size_t
{
  auto iter = active_.find(category);
  return iter == active_.end() ? 0 : iter->second;
}

auto query_throttle::queued(query_category category) const -> std::size_t
{
  return static_cast<std::size_t>(
    std::ranges::count_if(queue_, [category](const auto &entry) { return entry->category == category; }));
}

auto query_throttle::status() const -> std::map<query_category, category_status>
{
  const auto config = current_config();
  std::map<query_category, category_status> result;
  for (const auto category : all_categories) {
    result[category] = { .active = active(category), .max = config.max_for(category), .queued = queued(category) };
  }
  return result;
}

auto query_throttle::grant(query_category category) -> slot_token
{
  const slot_token token{ .category = category, .id = next_token_id_++, .acquired_at = std::chrono::steady_clock::now() };
  held_.emplace(token.id, token);
  ++active_[category];
  spdlog::trace("[query_throttle] Granted {} slot {}", to_string(category), token.id);
  return token;
}

auto query_throttle::process_queue() -> void
{
  if (queue_.empty()) { return; }
  const auto config = current_config();

  // queue_ is in arrival order, so a stable sort keeps FIFO within a category
  std::vector<std::shared_ptr<waiter>> ordered(queue_.begin(), queue_.end());
  std::ranges::stable_sort(
    ordered, [&config](const auto &lhs, const auto &rhs) { return config.rank(lhs->category) < config.rank(rhs->category); });

  for (const auto &entry : ordered) {
    if (active(entry->category) >= config.max_for(entry->category)) { continue; }
    entry->granted = grant(entry->category);
    remove_waiter(entry);
    entry->done.notify();
  }
}

auto query_throttle::remove_waiter(const std::shared_ptr<waiter> &entry) -> void { std::erase(queue_, entry); }

auto query_throttle::warn_if_over_capacity() const -> void
{
  const auto config = current_config();
  for (const auto category : all_categories) {
    if (active(category) > config.max_for(category)) {
      spdlog::warn("[query_throttle] {} holds {} slots over new capacity {}; admission paused until released",
        to_string(category),
        active(category),
        config.max_for(category));
    }
  }
}

}// namespace relay_feed::throttle
