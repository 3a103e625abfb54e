#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string_view>

namespace relay_feed::transport {

/**
 * @brief Parameters for establishing a WebSocket connection.
 */
struct websocket_connection_params
{
  std::string_view host;///< Hostname or IP address
  std::string_view port;///< Port number (typically "443" for wss://)
  std::string_view path;///< WebSocket path (e.g., "/" or "/api/v1")
};

/**
 * @brief Relay WebSocket stream over TLS.
 *
 * Each async_read delivers exactly one complete frame. Frames that do not fit
 * the caller's buffer fail with boost::asio::error::message_size rather than
 * being truncated.
 */
class websocket_stream
{
private:
  static constexpr int handshake_timeout_seconds = 30;
  static constexpr std::size_t max_frame_bytes = 4 * 1024 * 1024;

  boost::asio::ssl::context ssl_context_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>> ws_;
  boost::beast::flat_buffer read_buffer_;

public:
  /**
   * @brief Constructs a WebSocket stream.
   *
   * @param io_context Boost.Asio io_context for async operations
   */
  explicit websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context);

  /**
   * @brief Resolves, connects, performs the TLS and WebSocket handshakes.
   *
   * @param params Connection parameters (host, port, path); copied before returning
   * @param handler Completion handler called with error code and bytes transferred
   */
  auto async_connect(websocket_connection_params params,
    std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void;

  /**
   * @brief Writes one text frame.
   *
   * Only one write may be outstanding at a time.
   */
  auto async_write(std::span<const std::byte> data,
    std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void;

  /**
   * @brief Reads one frame into buffer.
   */
  auto async_read(const boost::asio::mutable_buffer &buffer,
    std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void;

  auto async_close(std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void;
};

}// namespace relay_feed::transport
