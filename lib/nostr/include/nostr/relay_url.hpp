#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace relay_feed::nostr {

/**
 * @brief Host, port and path of a relay, ready for a WebSocket handshake.
 */
struct relay_endpoint
{
  std::string host;///< Lower-cased hostname or IP literal
  std::string port;///< Port number, "443" when the URL has none
  std::string path;///< Request target, "/" when the URL has none
};

/**
 * @brief Normalizes a relay URL into the key used everywhere in the pool.
 *
 * Trims whitespace, assumes wss:// when no scheme is given, upgrades ws://
 * to wss://, lower-cases the host, drops the default port (443, or 80 on a
 * ws:// URL), the query and the fragment, and strips a trailing slash from the
 * path.
 *
 * @param url Relay URL as typed by a user or found in an event
 * @return Normalized URL, or the input unchanged when it has no usable host
 */
[[nodiscard]] auto normalize_relay_url(std::string_view url) -> std::string;

/**
 * @brief Splits a relay URL into connection parameters.
 *
 * The URL is normalized first, so ws:// endpoints are dialed over TLS on 443.
 *
 * @return Endpoint, or std::nullopt when the URL has no host or a bad port
 */
[[nodiscard]] auto parse_relay_endpoint(std::string_view url) -> std::optional<relay_endpoint>;

}// namespace relay_feed::nostr
