#include <pool/connection_registry.hpp>

namespace relay_feed::pool {

auto connection_registry::ensure(const std::string &url) -> connection_status &
{
  auto [iter, inserted] = statuses_.try_emplace(url);
  if (inserted) { iter->second.url = url; }
  return iter->second;
}

auto connection_registry::find(const std::string &url) const -> std::optional<connection_status>
{
  auto iter = statuses_.find(url);
  if (iter == statuses_.end()) { return std::nullopt; }
  return iter->second;
}

auto connection_registry::mark_connected(const std::string &url, clock::time_point now) -> void
{
  auto &status = ensure(url);
  status.connected = true;
  status.last_connected_at = now;
  status.connection_attempts = 0;
  status.last_error.reset();
}

auto connection_registry::mark_disconnected(const std::string &url) -> void
{
  auto iter = statuses_.find(url);
  if (iter != statuses_.end()) { iter->second.connected = false; }
}

auto connection_registry::record_failure(const std::string &url, const std::string &error) -> int
{
  auto &status = ensure(url);
  status.connected = false;
  status.last_error = error;
  return ++status.connection_attempts;
}

auto connection_registry::record_health_check(const std::string &url, clock::time_point now) -> void
{
  ensure(url).last_health_check_at = now;
}

auto connection_registry::reset_attempts() -> void
{
  for (auto &[url, status] : statuses_) {
    status.connection_attempts = 0;
    status.last_error.reset();
  }
}

auto connection_registry::attempts(const std::string &url) const -> int
{
  auto iter = statuses_.find(url);
  return iter == statuses_.end() ? 0 : iter->second.connection_attempts;
}

auto connection_registry::statuses() const -> std::vector<connection_status>
{
  std::vector<connection_status> result;
  result.reserve(statuses_.size());
  for (const auto &[url, status] : statuses_) { result.push_back(status); }
  return result;
}

auto connection_registry::connected_urls() const -> std::vector<std::string>
{
  std::vector<std::string> result;
  for (const auto &[url, status] : statuses_) {
    if (status.connected) { result.push_back(url); }
  }
  return result;
}

}// namespace relay_feed::pool
