#pragma once

#include <acp/rpc_connection.hpp>
#include <core/credentials.hpp>
#include <transport/websocket_stream.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tether::acp {

/// Upgrade request headers for a credential set; empty secrets produce no header.
[[nodiscard]] auto auth_headers(const core::connection_credentials &credentials)
  -> std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Opens ACP connections over TLS WebSockets.
 */
class websocket_connector
{
public:
  using connection_t = rpc_connection<transport::websocket_stream>;

  explicit websocket_connector(const std::shared_ptr<boost::asio::io_context> &io_context);

  /**
   * @brief Connects the transport for one credential set.
   *
   * The trust policy is pinned when the credentials carry a fingerprint and system trust otherwise.
   * The same timeout bounds the transport handshake and every later request.
   *
   * @throws std::invalid_argument for ws:// or otherwise unusable URLs
   * @throws security::fingerprint_mismatch when the pinned certificate did not match
   * @throws boost::system::system_error for connectivity failures
   */
  auto open(const core::connection_credentials &credentials, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::shared_ptr<connection_t>>;

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
};

}// namespace tether::acp
