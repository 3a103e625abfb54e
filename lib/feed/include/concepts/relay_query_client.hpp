#pragma once

#include <nostr/protocol.hpp>

#include <boost/asio/awaitable.hpp>
#include <concepts>
#include <string>
#include <vector>

namespace relay_feed::concepts {

/**
 * @brief Anything that can fan a filter out to a set of relays.
 *
 * connection_pool satisfies this; feeds only depend on the concept.
 */
template<typename T>
concept relay_query_client =
  requires(T &client, std::vector<std::string> urls, nostr::protocol::filter filter) {
    {
      client.query(urls, filter)
    } -> std::same_as<boost::asio::awaitable<std::vector<nostr::protocol::event_data>>>;
  };

}// namespace relay_feed::concepts
