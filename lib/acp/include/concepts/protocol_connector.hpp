#pragma once

#include <acp/types.hpp>
#include <core/credentials.hpp>

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <concepts>
#include <functional>
#include <memory>
#include <string>

namespace tether::concepts {

/**
 * @brief An open protocol session channel to one agent.
 *
 * Mirrors the protocol operations the connection state machine drives: the initialize handshake,
 * session creation and resumption, prompting, and the inbound callbacks (streaming updates,
 * permission requests and transport loss).
 */
template<typename T>
concept protocol_connection = requires(T &connection,
  std::string text,
  std::function<void(const acp::session_update &)> update_handler,
  std::function<boost::asio::awaitable<acp::permission_outcome>(acp::permission_request)> permission_handler,
  std::function<void(const std::string &)> close_handler) {
  { connection.initialize() } -> std::same_as<boost::asio::awaitable<acp::agent_info>>;
  { connection.new_session(text) } -> std::same_as<boost::asio::awaitable<std::string>>;
  { connection.load_session(text, text) } -> std::same_as<boost::asio::awaitable<void>>;
  { connection.prompt(text, text) } -> std::same_as<boost::asio::awaitable<std::string>>;
  { connection.close() } -> std::same_as<boost::asio::awaitable<void>>;
  { connection.is_open() } -> std::convertible_to<bool>;
  connection.set_update_handler(update_handler);
  connection.set_permission_handler(permission_handler);
  connection.set_close_handler(close_handler);
};

/**
 * @brief Opens protocol connections from a credential set.
 *
 * open() throws security::fingerprint_mismatch when a pinned handshake saw the wrong certificate,
 * and any other exception for ordinary connectivity failures.
 */
template<typename T>
concept protocol_connector = requires(T &connector,
  const core::connection_credentials &credentials,
  std::chrono::milliseconds timeout) {
  typename T::connection_t;
  requires protocol_connection<typename T::connection_t>;
  { connector.open(credentials, timeout) } -> std::same_as<boost::asio::awaitable<std::shared_ptr<typename T::connection_t>>>;
};

}// namespace tether::concepts
