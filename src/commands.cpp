#include "commands.hpp"

#include <async/oneshot.hpp>
#include <core/processor_runner.hpp>
#include <pairing/errors.hpp>
#include <pairing/pairing_client.hpp>
#include <pairing/pairing_url.hpp>
#include <platform/env_utils.hpp>
#include <platform/time_utils.hpp>
#include <session/agent_connection.hpp>
#include <session/connection_state.hpp>
#include <session/errors.hpp>
#include <transport/https_client.hpp>

#include <algorithm>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cctype>
#include <csignal>
#include <cstdio>
#include <fmt/core.h>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace tether::app {

namespace {
  auto lowercase(std::string text) -> std::string
  {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char character) {
      return static_cast<char>(std::tolower(character));
    });
    return text;
  }

  /// Resolves an id, a case-insensitive name, or a unique id prefix.
  auto resolve_peer(registry::peer_store &store, const std::string &reference) -> std::optional<core::peer>
  {
    if (auto exact = store.find(reference)) { return exact; }

    const auto peers = store.list();
    const auto wanted = lowercase(reference);
    for (const auto &record : peers) {
      if (lowercase(record.name) == wanted) { return record; }
    }

    std::optional<core::peer> prefix_match;
    for (const auto &record : peers) {
      if (not record.id.starts_with(reference)) { continue; }
      if (prefix_match) { return std::nullopt; }
      prefix_match = record;
    }
    return prefix_match;
  }

  auto print_events(async::async_queue<core::events::peer_event_t> &events) -> void
  {
    while (auto event = events.try_pop()) { fmt::print("  {}\n", core::events::describe(*event)); }
  }

  /// Drains the peer event queue onto stdout for `watch`.
  class event_printer
  {
  public:
    explicit event_printer(std::shared_ptr<async::async_queue<core::events::peer_event_t>> events)
      : events_(std::move(events))
    {}

    auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
    {
      while (true) {
        auto event = co_await events_->pop(cancel_slot);
        fmt::print("[{}] {}\n", platform::format_current_time_hms(), core::events::describe(event));
        std::fflush(stdout);
      }
    }

  private:
    std::shared_ptr<async::async_queue<core::events::peer_event_t>> events_;
  };

  auto run_pair(command_context &context) -> boost::asio::awaitable<int>
  {
    const auto descriptor = pairing::parse_pairing_url(context.args.pair_url);
    fmt::print("Pairing with {} over {}\n", descriptor.base_url, descriptor.description());

    auto http = std::make_shared<transport::https_client>(context.io_context);
    pairing::pairing_client<transport::https_client> client(http);
    const auto credentials = co_await client.pair(descriptor);
    const auto kind = *descriptor.transport();

    fmt::print("Code accepted. Checking the connection (the bridge may ask you to approve access)...\n");
    auto probe = std::make_shared<session::agent_connection<connector_t>>(context.io_context,
      context.connector,
      credentials,
      session::connection_profile::pairing(),
      platform::current_working_directory());
    co_await probe->connect();

    if (not probe->is_connected()) {
      fmt::print(stderr, "Paired, but could not connect: {}\n", session::to_string(probe->state()));
      co_return 1;
    }

    const auto bridge_id =
      context.args.pair_bridge_id.empty() ? std::nullopt : std::optional<std::string>(context.args.pair_bridge_id);
    const auto registered = context.manager->register_paired(credentials, kind, context.args.pair_name, bridge_id);
    context.peers->update_session(registered.peer.id, *probe->session_id(), probe->supports_load_session());
    co_await probe->disconnect();

    fmt::print("{}\n", registered.message);
    if (registered.new_peer) { fmt::print("Agent id: {}\n", registered.peer.id); }
    co_return 0;
  }

  auto run_peers(command_context &context) -> boost::asio::awaitable<int>
  {
    const auto peers = context.peers->list();
    if (peers.empty()) {
      fmt::print("No paired agents. Use `tether pair <url>` to add one.\n");
      co_return 0;
    }

    for (const auto &record : peers) {
      fmt::print("{} ({})\n", record.name, record.id);
      fmt::print("  status:  {}\n", core::to_string(record.status));
      if (record.session_id) {
        fmt::print("  session: {}{}\n",
          *record.session_id,
          record.session_started_at
            ? fmt::format(" since {}", platform::format_local_datetime(*record.session_started_at))
            : std::string{});
      }
      if (record.preferred_transport) { fmt::print("  prefers: {}\n", core::to_string(*record.preferred_transport)); }
      if (record.endpoints.empty()) { fmt::print("  url:     {}\n", record.url); }
      for (const auto &endpoint : core::sorted_endpoints(record)) {
        fmt::print("  {} {:<14} {}\n", endpoint.active ? '*' : '-', core::to_string(endpoint.kind), endpoint.url);
      }
    }
    co_return 0;
  }

  auto require_peer(command_context &context) -> core::peer
  {
    auto record = resolve_peer(*context.peers, context.args.peer);
    if (not record) { throw std::invalid_argument("No agent matches '" + context.args.peer + "'"); }
    return *record;
  }

  auto run_connect(command_context &context) -> boost::asio::awaitable<int>
  {
    const auto record = require_peer(context);
    fmt::print("Connecting to {}\n", record.name);

    const auto connected = co_await context.manager->connect_peer(record.id);
    print_events(*context.events);

    if (connected) {
      const auto transport = context.manager->active_transport(record.id);
      fmt::print("Connected to {}{}\n",
        record.name,
        transport ? fmt::format(" via {}", core::display_name(*transport)) : std::string{});
    } else {
      fmt::print(stderr, "Could not reach {}\n", record.name);
    }

    co_await context.manager->disconnect_all();
    co_return connected ? 0 : 1;
  }

  /// Reads the user's choice on a helper thread and hands it back on the io_context.
  auto ask_permission(const std::shared_ptr<boost::asio::io_context> &io_context,
    const std::weak_ptr<manager_t::agent_connection_t> &weak_client,
    const acp::permission_request &request) -> void
  {
    fmt::print("\n[permission] {}\n", request.title);
    if (request.command) { fmt::print("  command: {}\n", *request.command); }
    for (std::size_t index = 0; index < request.options.size(); ++index) {
      fmt::print("  {}) {}\n", index + 1, request.options[index].name);
    }
    fmt::print("Choose an option (anything else rejects): ");
    std::fflush(stdout);

    std::thread([io_context, weak_client, request]() {
      std::string line;
      std::getline(std::cin, line);

      boost::asio::post(*io_context, [weak_client, request, line]() {
        auto client = weak_client.lock();
        if (not client) { return; }

        std::size_t choice = 0;
        try {
          choice = std::stoul(line);
        } catch (const std::logic_error &) {
          choice = 0;
        }

        try {
          if (choice >= 1 and choice <= request.options.size()) {
            client->approve_tool(request.tool_call_id, request.options[choice - 1].option_id);
          } else {
            client->reject_tool(request.tool_call_id);
          }
        } catch (const session::session_error &error) {
          fmt::print(stderr, "{}\n", error.what());
        }
      });
    }).detach();
  }

  auto run_send(command_context &context) -> boost::asio::awaitable<int>
  {
    const auto record = require_peer(context);
    auto client = co_await context.manager->get_connected_client(record.id);
    print_events(*context.events);
    if (not client) {
      fmt::print(stderr, "Could not reach {}\n", record.name);
      co_return 1;
    }

    client->set_permission_request_handler(
      [io_context = context.io_context, weak_client = std::weak_ptr(client)](const acp::permission_request &request) {
        ask_permission(io_context, weak_client, request);
      });

    auto finished = std::make_shared<async::oneshot<std::optional<std::string>>>(context.io_context);
    client->send_message(context.args.send_message,
      session::stream_callbacks{ .on_text =
                                   [](const std::string &text) {
                                     fmt::print("{}", text);
                                     std::fflush(stdout);
                                   },
        .on_thought = [](const std::string &text) { spdlog::debug("[thinking] {}", text); },
        .on_tool_call = [](const acp::tool_call &call) { fmt::print("\n[tool] {} ({})\n", call.title, call.status); },
        .on_tool_call_update =
          [](const acp::tool_call_update &update) {
            if (update.status) { fmt::print("[tool] {}: {}\n", update.id, *update.status); }
            if (not update.output.empty()) { fmt::print("{}\n", update.output); }
          },
        .on_complete = [finished](std::optional<std::string> stop_reason) { finished->set_value(std::move(stop_reason)); } });

    const auto stop_reason = co_await finished->get();
    fmt::print("\n");
    co_await context.manager->disconnect_all();

    if (not stop_reason) {
      fmt::print(stderr, "The turn did not complete\n");
      co_return 1;
    }
    spdlog::info("Turn ended: {}", *stop_reason);
    co_return 0;
  }

  auto run_prefer(command_context &context) -> boost::asio::awaitable<int>
  {
    const auto record = require_peer(context);
    const auto kind = context.args.prefer_kind == "none" ? std::nullopt
                                                          : core::parse_transport_kind(context.args.prefer_kind);
    context.manager->set_preferred_transport(record.id, kind);
    fmt::print("{} now prefers {}\n", record.name, kind ? core::display_name(*kind) : "the default order");
    co_return 0;
  }

  auto run_clear_session(command_context &context) -> boost::asio::awaitable<int>
  {
    const auto record = require_peer(context);
    co_await context.manager->clear_session(record.id);
    fmt::print("Session cleared for {}\n", record.name);
    co_return 0;
  }

  auto run_forget(command_context &context) -> boost::asio::awaitable<int>
  {
    const auto record = require_peer(context);
    co_await context.manager->remove_peer(record.id);
    fmt::print("Removed {}\n", record.name);
    co_return 0;
  }

  auto run_watch(command_context &context) -> boost::asio::awaitable<int>
  {
    auto manager_cancel = std::make_shared<boost::asio::cancellation_signal>();
    auto printer_cancel = std::make_shared<boost::asio::cancellation_signal>();

    auto printer = std::make_shared<event_printer>(context.events);
    core::spawn_processor(context.io_context,
      printer,
      std::make_shared<boost::asio::cancellation_slot>(printer_cancel->slot()),
      "event_printer");
    core::spawn_processor(context.io_context,
      context.manager,
      std::make_shared<boost::asio::cancellation_slot>(manager_cancel->slot()),
      "peer_manager");

    const auto started = context.manager->auto_connect_all();
    fmt::print("Watching {} agents (Ctrl-C to stop)\n", started);
    std::fflush(stdout);

    boost::asio::signal_set signals(*context.io_context, SIGINT, SIGTERM);
    const auto signal_number = co_await signals.async_wait(boost::asio::use_awaitable);
    spdlog::debug("Received signal {}, shutting down", signal_number);

    manager_cancel->emit(boost::asio::cancellation_type::all);
    printer_cancel->emit(boost::asio::cancellation_type::all);
    context.manager->cancel_attempts();
    co_await context.manager->disconnect_all();
    co_return 0;
  }
}// namespace

auto run_command(command_context &context) -> boost::asio::awaitable<int>
{
  try {
    if (context.args.pair_parsed) { co_return co_await run_pair(context); }
    if (context.args.peers_parsed) { co_return co_await run_peers(context); }
    if (context.args.connect_parsed) { co_return co_await run_connect(context); }
    if (context.args.send_parsed) { co_return co_await run_send(context); }
    if (context.args.prefer_parsed) { co_return co_await run_prefer(context); }
    if (context.args.clear_session_parsed) { co_return co_await run_clear_session(context); }
    if (context.args.forget_parsed) { co_return co_await run_forget(context); }
    if (context.args.watch_parsed) { co_return co_await run_watch(context); }
  } catch (const pairing::pairing_error &error) {
    spdlog::debug("Pairing failed ({})", pairing::to_string(error.kind()));
    fmt::print(stderr, "{}\n", error.what());
    co_return 1;
  }

  fmt::print(stderr, "No command given; run with --help for usage\n");
  co_return 1;
}

}// namespace tether::app
