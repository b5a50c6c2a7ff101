#pragma once

#include <security/trust_policy.hpp>
#include <transport/operation_deadline.hpp>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tether::transport {

/**
 * @brief Parameters for establishing a secure WebSocket connection.
 */
struct websocket_connection_params
{
  std::string host;///< Hostname or IP address
  std::string port;///< Port number
  std::string path;///< Request target, e.g. "/" or "/acp?x=1"
  std::vector<std::pair<std::string, std::string>> headers;///< Extra upgrade request headers
  security::trust_policy trust;///< Certificate trust decision for this connection
  std::chrono::seconds timeout{ 30 };///< Covers name resolution, TCP connect, TLS and WebSocket handshakes
};

/**
 * @brief TLS WebSocket stream delivering whole text messages.
 *
 * Plain ws:// is not supported.
 */
class websocket_stream
{
private:
  boost::asio::ssl::context ssl_context_;
  boost::asio::ip::tcp::resolver resolver_;
  operation_deadline resolve_deadline_;
  boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>> ws_;
  boost::beast::flat_buffer read_buffer_;

public:
  using connection_params_t = websocket_connection_params;

  /**
   * @brief Constructs a WebSocket stream.
   *
   * @param io_context Boost.Asio io_context for async operations
   */
  explicit websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context);

  /**
   * @brief Resolves, connects, performs the TLS handshake under the trust policy, then upgrades.
   *
   * @param params Connection parameters
   * @param handler Completion handler
   */
  auto async_connect(websocket_connection_params params, std::function<void(const boost::system::error_code &)> handler)
    -> void;

  /**
   * @brief Sends one text message. `message` must outlive the operation.
   */
  auto async_write(std::string_view message, std::function<void(const boost::system::error_code &)> handler) -> void;

  /**
   * @brief Reads the next complete message.
   */
  auto async_read(std::function<void(const boost::system::error_code &, std::string)> handler) -> void;

  auto async_close(std::function<void(const boost::system::error_code &)> handler) -> void;
};

}// namespace tether::transport
