#pragma once

#include <cstddef>

namespace relay_feed::feed {

/**
 * @brief Count of recent page failures shared by every feed of an orchestrator.
 */
class failure_tracker
{
public:
  auto increment() -> void { ++count_; }
  auto reset() -> void { count_ = 0; }
  [[nodiscard]] auto count() const -> std::size_t { return count_; }

private:
  std::size_t count_{ 0 };
};

}// namespace relay_feed::feed
