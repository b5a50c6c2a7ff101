#pragma once

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace tether::cli_utils {

struct cli_args
{
  static constexpr int default_sweep_interval_seconds = 30;
  static constexpr int default_max_retries = 3;
  static constexpr int default_timeout_seconds = 300;

  std::string data_dir = "~/.tether";
  bool verbose = false;
  bool show_version = false;
  int sweep_interval_seconds = default_sweep_interval_seconds;
  int max_retries = default_max_retries;
  int timeout_seconds = default_timeout_seconds;

  std::string peer;///< Peer id or name for commands that act on one peer

  bool pair_parsed = false;
  std::string pair_url;
  std::string pair_name;
  std::string pair_bridge_id;

  bool peers_parsed = false;
  bool connect_parsed = false;

  bool send_parsed = false;
  std::string send_message;

  bool prefer_parsed = false;
  std::string prefer_kind;

  bool clear_session_parsed = false;
  bool forget_parsed = false;
  bool watch_parsed = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-d,--data-dir", args.data_dir, "Directory holding peers.json and credentials.json");
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");
  app.add_option("--sweep-interval", args.sweep_interval_seconds, "Seconds between background reconnect passes")
    ->check(CLI::PositiveNumber);
  app.add_option("--max-retries", args.max_retries, "Connection attempts per endpoint")->check(CLI::PositiveNumber);
  app.add_option("--timeout", args.timeout_seconds, "Seconds allowed for each connection attempt and request")
    ->check(CLI::PositiveNumber);

  auto *pair_cmd = app.add_subcommand("pair", "Pair with a bridge using a pairing URL");
  pair_cmd->add_option("url", args.pair_url, "Pairing URL, e.g. https://host:3001/pair/direct?code=123456&fp=SHA256:...")
    ->required();
  pair_cmd->add_option("--name", args.pair_name, "Display name for the agent");
  pair_cmd->add_option("--bridge-id", args.pair_bridge_id, "Stable bridge id, merges transports of one agent");
  pair_cmd->callback([&args]() { args.pair_parsed = true; });

  auto *peers_cmd = app.add_subcommand("peers", "List paired agents");
  peers_cmd->callback([&args]() { args.peers_parsed = true; });

  auto *connect_cmd = app.add_subcommand("connect", "Connect to an agent, trying each transport in order");
  connect_cmd->add_option("peer", args.peer, "Agent id or name")->required();
  connect_cmd->callback([&args]() { args.connect_parsed = true; });

  auto *send_cmd = app.add_subcommand("send", "Send a prompt and stream the answer");
  send_cmd->add_option("peer", args.peer, "Agent id or name")->required();
  send_cmd->add_option("message", args.send_message, "Prompt text")->required();
  send_cmd->callback([&args]() { args.send_parsed = true; });

  auto *prefer_cmd = app.add_subcommand("prefer", "Try one transport first for an agent");
  prefer_cmd->add_option("peer", args.peer, "Agent id or name")->required();
  prefer_cmd->add_option("kind", args.prefer_kind, "direct-pinned, relay-gateway, mesh-trusted, mesh-pinned or none")
    ->required()
    ->check(CLI::IsMember({ "direct-pinned", "relay-gateway", "mesh-trusted", "mesh-pinned", "none" }));
  prefer_cmd->callback([&args]() { args.prefer_parsed = true; });

  auto *clear_cmd = app.add_subcommand("clear-session", "Forget the agent's session; the next connect starts fresh");
  clear_cmd->add_option("peer", args.peer, "Agent id or name")->required();
  clear_cmd->callback([&args]() { args.clear_session_parsed = true; });

  auto *forget_cmd = app.add_subcommand("forget", "Delete an agent with all its transports and credentials");
  forget_cmd->add_option("peer", args.peer, "Agent id or name")->required();
  forget_cmd->callback([&args]() { args.forget_parsed = true; });

  auto *watch_cmd = app.add_subcommand("watch", "Connect every agent and keep reconnecting until interrupted");
  watch_cmd->callback([&args]() { args.watch_parsed = true; });
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "tether - pair with and connect to ACP agents", "tether" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  args.data_dir = platform::expand_tilde_path(args.data_dir);

  return args;
}

[[nodiscard]] inline auto has_command(const cli_args &args) -> bool
{
  return args.pair_parsed or args.peers_parsed or args.connect_parsed or args.send_parsed or args.prefer_parsed
         or args.clear_session_parsed or args.forget_parsed or args.watch_parsed;
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.data_dir.empty()) {
    spdlog::error("Data directory must not be empty");
    return false;
  }

  if (args.send_parsed and args.send_message.empty()) {
    spdlog::error("Send command requires a message");
    return false;
  }

  if (not args.show_version and not has_command(args)) {
    spdlog::error("No command given; run with --help for usage");
    return false;
  }

  return true;
}

}// namespace tether::cli_utils
