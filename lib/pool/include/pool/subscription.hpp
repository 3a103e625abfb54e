#pragma once

#include <functional>
#include <string>
#include <utility>

namespace relay_feed::pool {

/**
 * @brief Move-only handle to a live subscription; closing sends CLOSE to every relay.
 *
 * The subscription is closed when the handle is destroyed. An empty handle
 * does nothing.
 */
class subscription
{
public:
  using closer = std::function<void(const std::string &)>;

  subscription() = default;
  subscription(std::string id, closer on_close) : id_(std::move(id)), on_close_(std::move(on_close)) {}

  subscription(const subscription &) = delete;
  auto operator=(const subscription &) -> subscription & = delete;

  subscription(subscription &&other) noexcept : id_(std::move(other.id_)), on_close_(std::move(other.on_close_))
  {
    other.on_close_ = nullptr;
  }

  auto operator=(subscription &&other) noexcept -> subscription &
  {
    if (this != &other) {
      close();
      id_ = std::move(other.id_);
      on_close_ = std::move(other.on_close_);
      other.on_close_ = nullptr;
    }
    return *this;
  }

  ~subscription() { close(); }

  /// Safe to call more than once
  auto close() -> void
  {
    if (on_close_) {
      auto on_close = std::move(on_close_);
      on_close_ = nullptr;
      on_close(id_);
    }
  }

  [[nodiscard]] auto active() const -> bool { return static_cast<bool>(on_close_); }
  [[nodiscard]] auto id() const -> const std::string & { return id_; }

private:
  std::string id_;
  closer on_close_;
};

}// namespace relay_feed::pool
