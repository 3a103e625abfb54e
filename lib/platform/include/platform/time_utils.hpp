#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace relay_feed::platform {

/**
 * @brief Formats the current local time as HH:MM:SS.
 *
 * @return Current time formatted as "HH:MM:SS"
 */
[[nodiscard]] auto format_current_time_hms() -> std::string;

/**
 * @brief Current wall-clock time in unix seconds.
 */
[[nodiscard]] auto unix_now() -> std::uint64_t;

/**
 * @brief Converts a system clock time point to unix seconds.
 */
[[nodiscard]] auto to_unix_seconds(std::chrono::system_clock::time_point time_point) -> std::uint64_t;

/**
 * @brief Formats unix seconds as an ISO-8601 UTC timestamp.
 *
 * @param seconds Unix timestamp
 * @return Timestamp formatted as "YYYY-MM-DDTHH:MM:SSZ"
 */
[[nodiscard]] auto format_unix_timestamp(std::uint64_t seconds) -> std::string;

/**
 * @brief Formats an optional time point for diagnostics output.
 *
 * @return ISO-8601 UTC timestamp, or "never"
 */
[[nodiscard]] auto format_time_point(const std::optional<std::chrono::system_clock::time_point> &time_point)
  -> std::string;

}// namespace relay_feed::platform
