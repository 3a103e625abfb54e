#pragma once

#include <string>
#include <string_view>

namespace relay_feed::core {

/**
 * @brief Generates RFC 4122 UUIDs and subscription identifiers.
 */
class uuid_generator
{
public:
  /**
   * @brief Generates a new UUID string.
   *
   * @return UUID in canonical format (e.g., "550e8400-e29b-41d4-a716-446655440000")
   */
  [[nodiscard]] static auto generate() -> std::string;

  /**
   * @brief Generates a subscription ID for a REQ message.
   *
   * @param prefix Short tag identifying the caller (e.g., "query")
   * @return "<prefix>:<uuid>", never longer than 64 characters
   */
  [[nodiscard]] static auto subscription_id(std::string_view prefix) -> std::string;
};

}// namespace relay_feed::core
