#include <platform/time_utils.hpp>

#include <ctime>
#include <fmt/format.h>
#include <tuple>

namespace relay_feed::platform {

auto format_current_time_hms() -> std::string
{
  using namespace std::chrono;

  auto now = system_clock::now();
  const std::time_t time_now = system_clock::to_time_t(now);

  std::tm time_tm{};
#if defined(_WIN32)
  std::ignore = localtime_s(&time_tm, &time_now);
#else
  std::ignore = localtime_r(&time_now, &time_tm);
#endif

  return fmt::format("{:02d}:{:02d}:{:02d}", time_tm.tm_hour, time_tm.tm_min, time_tm.tm_sec);
}

auto unix_now() -> std::uint64_t { return to_unix_seconds(std::chrono::system_clock::now()); }

auto to_unix_seconds(std::chrono::system_clock::time_point time_point) -> std::uint64_t
{
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time_point.time_since_epoch()).count();
  return seconds < 0 ? 0 : static_cast<std::uint64_t>(seconds);
}

auto format_unix_timestamp(std::uint64_t seconds) -> std::string
{
  const auto time_value = static_cast<std::time_t>(seconds);

  std::tm time_tm{};
#if defined(_WIN32)
  std::ignore = gmtime_s(&time_tm, &time_value);
#else
  std::ignore = gmtime_r(&time_value, &time_tm);
#endif

  static constexpr int tm_year_base = 1900;
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
    time_tm.tm_year + tm_year_base,
    time_tm.tm_mon + 1,
    time_tm.tm_mday,
    time_tm.tm_hour,
    time_tm.tm_min,
    time_tm.tm_sec);
}

auto format_time_point(const std::optional<std::chrono::system_clock::time_point> &time_point) -> std::string
{
  if (not time_point) { return "never"; }
  return format_unix_timestamp(to_unix_seconds(*time_point));
}

}// namespace relay_feed::platform
