#pragma once

#include <acp/connector.hpp>
#include <async/async_queue.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/events.hpp>
#include <registry/credential_store.hpp>
#include <registry/peer_manager.hpp>
#include <registry/peer_store.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>

namespace tether::app {

using connector_t = acp::websocket_connector;
using manager_t = registry::peer_manager<connector_t, registry::file_credential_store, registry::peer_store>;

/**
 * @brief Everything a command needs, built once in main().
 */
struct command_context
{
  cli_utils::cli_args args;
  std::shared_ptr<boost::asio::io_context> io_context;
  std::shared_ptr<connector_t> connector;
  std::shared_ptr<registry::file_credential_store> credentials;
  std::shared_ptr<registry::peer_store> peers;
  std::shared_ptr<async::async_queue<core::events::peer_event_t>> events;
  std::shared_ptr<manager_t> manager;
};

/**
 * @brief Runs the subcommand selected on the command line.
 *
 * @return Process exit code
 */
auto run_command(command_context &context) -> boost::asio::awaitable<int>;

}// namespace tether::app
