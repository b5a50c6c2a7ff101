#include "commands.hpp"

#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <platform/env_utils.hpp>
#include <session/connection_state.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fmt/core.h>
#include <memory>
#include <spdlog/spdlog.h>

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = tether::cli_utils::parse_cli_args(argc, argv);

  if (args.show_version) {
    tether::cli_utils::print_version();
    return 0;
  }

  if (not tether::cli_utils::validate_cli_args(args)) { return 1; }

  tether::cli_utils::configure_logging(args);

  tether::app::command_context context;
  try {
    const std::filesystem::path data_dir{ args.data_dir };
    tether::platform::ensure_private_directory(data_dir);

    context.io_context = std::make_shared<boost::asio::io_context>();
    context.connector = std::make_shared<tether::app::connector_t>(context.io_context);
    context.credentials = std::make_shared<tether::registry::file_credential_store>(data_dir / "credentials.json");
    context.peers = std::make_shared<tether::registry::peer_store>(data_dir / "peers.json");
    context.events = std::make_shared<tether::async::async_queue<tether::core::events::peer_event_t>>(context.io_context);

    tether::session::connection_profile profile;
    profile.max_retries = args.max_retries;
    profile.attempt_timeout = std::chrono::seconds(args.timeout_seconds);

    context.manager = std::make_shared<tether::app::manager_t>(context.io_context,
      context.connector,
      context.credentials,
      context.peers,
      context.events,
      tether::registry::peer_manager_config{ .sweep_interval = std::chrono::seconds(args.sweep_interval_seconds),
        .profile = profile,
        .working_directory = tether::platform::current_working_directory() });
  } catch (const std::exception &error) {
    fmt::print(stderr, "Error: {}\n", error.what());
    return 1;
  }
  context.args = args;

  auto result = boost::asio::co_spawn(*context.io_context, tether::app::run_command(context), boost::asio::use_future);
  context.io_context->run();

  try {
    return result.get();
  } catch (const std::exception &error) {
    spdlog::debug("Command failed: {}", error.what());
    fmt::print(stderr, "Error: {}\n", error.what());
    return 1;
  }
}
