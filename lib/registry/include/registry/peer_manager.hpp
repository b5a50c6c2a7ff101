#pragma once

#include <async/async_queue.hpp>
#include <concepts/credential_store.hpp>
#include <concepts/peer_store.hpp>
#include <concepts/protocol_connector.hpp>
#include <core/credentials.hpp>
#include <core/events.hpp>
#include <core/identity.hpp>
#include <core/peer.hpp>
#include <core/processor_runner.hpp>
#include <core/transport_kind.hpp>
#include <session/agent_connection.hpp>
#include <session/connection_state.hpp>

#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <exception>
#include <fmt/format.h>
#include <map>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tether::registry {

struct peer_manager_config
{
  static constexpr auto default_sweep_interval = std::chrono::seconds(30);

  std::chrono::milliseconds sweep_interval{ default_sweep_interval };
  session::connection_profile profile{};
  std::string working_directory;
};

/// Outcome of registering a freshly paired transport.
struct registration
{
  core::peer peer;
  bool new_peer{ false };
  std::string message;
};

/**
 * @brief Owns every peer's live connection and drives endpoint fallback.
 *
 * One slot per peer holds the cached connection and the attempt in flight, so at most one connection
 * attempt runs per peer no matter how many callers ask for it. Each attempt runs as its own
 * cancellable coroutine; operations that change a peer's credentials, session or existence cancel
 * it and wait for it to finish before touching the store. Endpoints of a peer are tried one after
 * another in connection order until one connects. Peers without endpoints use their single stored
 * credential set. run() re-attempts disconnected peers on a fixed interval.
 *
 * Must be driven from the io_context thread.
 */
template<concepts::protocol_connector Connector,
  concepts::credential_store CredentialStore,
  concepts::peer_store PeerStore>
class peer_manager : public std::enable_shared_from_this<peer_manager<Connector, CredentialStore, PeerStore>>
{
public:
  using agent_connection_t = session::agent_connection<Connector>;
  using event_queue_t = async::async_queue<core::events::peer_event_t>;

  peer_manager(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<Connector> connector,
    std::shared_ptr<CredentialStore> credentials,
    std::shared_ptr<PeerStore> peers,
    std::shared_ptr<event_queue_t> events,
    peer_manager_config config)
    : io_context_(io_context), connector_(std::move(connector)), credentials_(std::move(credentials)),
      peers_(std::move(peers)), events_(std::move(events)), config_(std::move(config))
  {}

  peer_manager(const peer_manager &) = delete;
  auto operator=(const peer_manager &) -> peer_manager & = delete;
  peer_manager(peer_manager &&) = delete;
  auto operator=(peer_manager &&) -> peer_manager & = delete;
  ~peer_manager() = default;

  /**
   * @brief Creates a peer with one legacy credential set stored under its id.
   *
   * @param name Display name; derived from the URL when empty
   * @throws core::validation_error when the credentials are unusable
   */
  auto add_peer(const core::connection_credentials &credentials,
    const std::string &peer_id,
    const std::string &name,
    std::optional<std::string> bridge_id = std::nullopt) -> core::peer
  {
    credentials.validate();
    credentials_->save(peer_id, credentials);

    core::peer record{ .id = peer_id,
      .bridge_id = std::move(bridge_id),
      .name = name.empty() ? core::default_peer_name(credentials.url) : name,
      .url = credentials.url,
      .status = core::connection_status::disconnected,
      .endpoints = {},
      .preferred_transport = std::nullopt,
      .session_id = std::nullopt,
      .session_started_at = std::nullopt,
      .supports_load_session = false,
      .last_connected_at = std::nullopt };
    peers_->add(record);
    spdlog::info("[peer_manager] Added peer {} ({})", record.name, record.id);
    return record;
  }

  [[nodiscard]] auto find_peer_by_bridge_id(const std::string &bridge_id) -> std::optional<core::peer>
  {
    return peers_->find_by_bridge_id(bridge_id);
  }

  /**
   * @brief Finds a peer reachable at `url` (legacy URL or any endpoint), ignoring trailing slashes.
   *
   * With a client id, stored credentials for the match must carry the same client id.
   */
  [[nodiscard]] auto find_peer_by_url(const std::string &url, const std::optional<std::string> &client_id = std::nullopt)
    -> std::optional<core::peer>
  {
    const auto wanted = core::normalize_url(url);
    for (const auto &record : peers_->list()) {
      std::vector<std::string> keys;
      if (core::normalize_url(record.url) == wanted) { keys.push_back(record.id); }
      for (const auto &endpoint : record.endpoints) {
        if (core::normalize_url(endpoint.url) == wanted) { keys.push_back(endpoint.id); }
      }
      if (keys.empty()) { continue; }
      if (not client_id) { return record; }

      for (const auto &key : keys) {
        if (auto stored = credentials_->retrieve(key); stored and stored->client_id == client_id) { return record; }
      }
    }
    return std::nullopt;
  }

  /**
   * @brief Adds or updates the endpoint of `kind` for a peer and stores its credentials.
   *
   * Adding the first endpoint to a peer with a live legacy connection keeps that connection only if
   * the endpoint has the same URL; otherwise the connection is closed. A legacy attempt in flight is
   * cancelled.
   *
   * @return "Added <transport> to <peer>" or "Updated <transport> for <peer>"
   * @throws core::validation_error when the credentials are unusable
   * @throws std::invalid_argument for an unknown peer
   */
  auto register_endpoint(const std::string &peer_id, core::transport_kind kind, const core::connection_credentials &credentials)
    -> std::string
  {
    credentials.validate();
    const auto record = require_peer(peer_id);

    const auto result = peers_->upsert_endpoint(peer_id, kind, credentials.url, core::default_priority(kind));
    credentials_->save(result.endpoint.id, credentials);
    if (result.created and record.endpoints.empty()) { leave_legacy_mode(peer_id, result.endpoint); }

    auto message = result.created ? fmt::format("Added {} to {}", core::display_name(kind), record.name)
                                  : fmt::format("Updated {} for {}", core::display_name(kind), record.name);
    spdlog::info("[peer_manager] {}", message);
    return message;
  }

  /**
   * @brief Records a paired transport: reuses the peer with the same bridge id, then the same URL,
   * otherwise creates one.
   */
  auto register_paired(const core::connection_credentials &credentials,
    core::transport_kind kind,
    const std::string &name,
    const std::optional<std::string> &bridge_id) -> registration
  {
    std::optional<core::peer> existing;
    if (bridge_id) { existing = find_peer_by_bridge_id(*bridge_id); }
    if (not existing) { existing = find_peer_by_url(credentials.url, credentials.client_id); }

    registration result;
    if (existing) {
      result.peer = *existing;
    } else {
      result.peer = add_peer(credentials, core::new_peer_id(), name, bridge_id);
      result.new_peer = true;
    }
    result.message = register_endpoint(result.peer.id, kind, credentials);
    result.peer = require_peer(result.peer.id);
    return result;
  }

  /**
   * @brief Replaces a peer's legacy credentials; the live connection, any attempt in flight and the
   * session are dropped.
   */
  auto update_peer_credentials(std::string peer_id, core::connection_credentials credentials)
    -> boost::asio::awaitable<void>
  {
    credentials.validate();
    require_peer(peer_id);

    co_await abandon_attempt(peer_id);
    auto connection = detach_connection(peer_id);
    credentials_->save(peer_id, credentials);
    peers_->update_url(peer_id, credentials.url);
    peers_->clear_session(peer_id);
    set_status(peer_id, core::connection_status::disconnected);
    if (connection) { co_await connection->disconnect(); }
  }

  /**
   * @brief Disconnects and deletes a peer with its endpoints and every stored credential.
   */
  auto remove_peer(std::string peer_id) -> boost::asio::awaitable<void>
  {
    require_peer(peer_id);

    co_await abandon_attempt(peer_id);
    const auto record = require_peer(peer_id);
    auto connection = detach_connection(peer_id);
    slots_.erase(peer_id);
    for (const auto &endpoint : record.endpoints) { credentials_->remove(endpoint.id); }
    credentials_->remove(peer_id);
    peers_->remove(peer_id);
    spdlog::info("[peer_manager] Removed peer {}", record.name);
    if (connection) { co_await connection->disconnect(); }
  }

  /**
   * @brief Forgets the session and drops the live connection and any attempt in flight; the next
   * connect starts a new session.
   */
  auto clear_session(std::string peer_id) -> boost::asio::awaitable<void>
  {
    require_peer(peer_id);

    co_await abandon_attempt(peer_id);
    peers_->clear_session(peer_id);
    auto connection = detach_connection(peer_id);
    set_status(peer_id, core::connection_status::disconnected);
    if (connection) { co_await connection->disconnect(); }
  }

  auto set_preferred_transport(const std::string &peer_id, std::optional<core::transport_kind> kind) -> void
  {
    require_peer(peer_id);
    peers_->set_preferred_transport(peer_id, kind);
  }

  /**
   * @brief Deletes one endpoint and its credentials, disconnecting first if it is the live one.
   *
   * An attempt in flight is abandoned, since it may be using the endpoint.
   *
   * @return false when the peer has no such endpoint
   */
  auto delete_endpoint(std::string peer_id, std::string endpoint_id) -> boost::asio::awaitable<bool>
  {
    require_peer(peer_id);

    co_await abandon_attempt(peer_id);
    std::shared_ptr<agent_connection_t> connection;
    if (auto slot = find_slot(peer_id); slot and slot->endpoint_id == endpoint_id) {
      connection = detach_connection(peer_id);
      set_status(peer_id, core::connection_status::disconnected);
    }
    credentials_->remove(endpoint_id);
    const auto removed = peers_->remove_endpoint(peer_id, endpoint_id);
    if (connection) { co_await connection->disconnect(); }
    co_return removed;
  }

  [[nodiscard]] auto active_transport(const std::string &peer_id) -> std::optional<core::transport_kind>
  {
    auto active = core::active_endpoint(require_peer(peer_id));
    if (not active) { return std::nullopt; }
    return active->kind;
  }

  [[nodiscard]] auto endpoints(const std::string &peer_id) -> std::vector<core::transport_endpoint>
  {
    return core::sorted_endpoints(require_peer(peer_id));
  }

  /**
   * @brief Returns the peer's live connection, connecting first when needed.
   *
   * Concurrent callers for one peer share a single attempt. A live connection is reused without
   * reconnecting.
   *
   * @return The connection, or nullptr when every endpoint failed
   * @throws std::invalid_argument for an unknown peer
   */
  auto get_connected_client(std::string peer_id) -> boost::asio::awaitable<std::shared_ptr<agent_connection_t>>
  {
    auto slot = slot_for(peer_id);

    std::shared_ptr<attempt_state> started;
    if (not slot->attempt) {
      if (auto live = live_connection(*slot)) { co_return live; }
      started = start_attempt(peer_id, slot);
    }

    co_await wait_for(started ? started : slot->attempt);
    if (started and started->failure) { std::rethrow_exception(started->failure); }
    co_return live_connection(*slot);
  }

  /// True when a connection was established.
  auto connect_peer(std::string peer_id) -> boost::asio::awaitable<bool>
  {
    auto connection = co_await get_connected_client(peer_id);
    co_return connection != nullptr;
  }

  /// Starts connection attempts for every peer that is not live.
  auto auto_connect_all() -> std::size_t { return reconnect_idle_peers("startup"); }

  /// One background pass: re-attempts every peer that is not live.
  auto sweep_once() -> std::size_t { return reconnect_idle_peers("sweep"); }

  /**
   * @brief Runs the background sweep until cancelled.
   *
   * Cancellation also cancels the attempts the sweep started.
   */
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
  {
    boost::asio::steady_timer timer(*io_context_);
    while (true) {
      timer.expires_after(config_.sweep_interval);
      boost::system::error_code error;
      if (cancel_slot) {
        co_await timer.async_wait(boost::asio::bind_cancellation_slot(
          *cancel_slot, boost::asio::redirect_error(boost::asio::use_awaitable, error)));
      } else {
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));
      }

      if (error) {
        cancel_attempts();
        throw boost::system::system_error(error);
      }
      sweep_once();
    }
  }

  /// Cancels every connection attempt currently in flight.
  auto cancel_attempts() -> void
  {
    for (auto &[peer_id, slot] : slots_) {
      if (slot->attempt) { slot->attempt->cancel.emit(boost::asio::cancellation_type::terminal); }
    }
  }

  /// Abandons every attempt and disconnects every live connection; used on shutdown.
  auto disconnect_all() -> boost::asio::awaitable<void>
  {
    std::vector<std::string> peer_ids;
    for (const auto &[peer_id, slot] : slots_) { peer_ids.push_back(peer_id); }
    for (const auto &peer_id : peer_ids) {
      co_await abandon_attempt(peer_id);
      if (not peers_->find(peer_id)) { continue; }
      auto connection = detach_connection(peer_id);
      set_status(peer_id, core::connection_status::disconnected);
      if (connection) { co_await connection->disconnect(); }
    }
  }

  [[nodiscard]] auto attempt_in_flight(const std::string &peer_id) const -> bool
  {
    auto found = slots_.find(peer_id);
    return found != slots_.end() and found->second->attempt != nullptr;
  }

private:
  struct attempt_state
  {
    explicit attempt_state(boost::asio::io_context &io_context)
      : done(io_context, boost::asio::steady_timer::time_point::max())
    {}

    boost::asio::steady_timer done;///< Cancelled when the attempt ends
    boost::asio::cancellation_signal cancel;
    std::exception_ptr failure;
    bool finished{ false };
  };

  struct peer_slot
  {
    std::shared_ptr<agent_connection_t> connection;
    std::optional<std::string> endpoint_id;///< Endpoint the live connection runs through; empty for legacy
    std::shared_ptr<attempt_state> attempt;///< Set while an attempt runs
  };

  auto require_peer(const std::string &peer_id) -> core::peer
  {
    auto record = peers_->find(peer_id);
    if (not record) { throw std::invalid_argument("Unknown peer: " + peer_id); }
    return *record;
  }

  auto find_slot(const std::string &peer_id) -> std::shared_ptr<peer_slot>
  {
    auto found = slots_.find(peer_id);
    return found == slots_.end() ? nullptr : found->second;
  }

  auto slot_for(const std::string &peer_id) -> std::shared_ptr<peer_slot>
  {
    require_peer(peer_id);
    auto &slot = slots_[peer_id];
    if (not slot) { slot = std::make_shared<peer_slot>(); }
    return slot;
  }

  static auto live_connection(const peer_slot &slot) -> std::shared_ptr<agent_connection_t>
  {
    if (slot.connection and slot.connection->is_connected()) { return slot.connection; }
    return nullptr;
  }

  auto publish(core::events::peer_event_t event) -> void
  {
    if (events_ and not events_->push(std::move(event))) { spdlog::trace("[peer_manager] Event queue closed, event dropped"); }
  }

  auto set_status(const std::string &peer_id, core::connection_status status) -> void
  {
    peers_->set_status(peer_id, status);
    publish(core::events::peer_status_changed{ .peer_id = peer_id, .status = status });
  }

  /// Takes the live connection out of the peer's slot; the caller disconnects it.
  auto detach_connection(const std::string &peer_id) -> std::shared_ptr<agent_connection_t>
  {
    auto slot = find_slot(peer_id);
    if (not slot) { return nullptr; }

    slot->endpoint_id.reset();
    return std::exchange(slot->connection, nullptr);
  }

  static auto close_detached(std::shared_ptr<agent_connection_t> connection) -> boost::asio::awaitable<void>
  {
    co_await connection->disconnect();
  }

  /**
   * @brief Keeps the store consistent when a peer gains its first endpoint.
   *
   * The store already made the endpoint active when it matches the legacy URL; the slot follows.
   * Otherwise the legacy connection is no longer reflected by any endpoint and is closed.
   */
  auto leave_legacy_mode(const std::string &peer_id, const core::transport_endpoint &endpoint) -> void
  {
    auto slot = find_slot(peer_id);
    if (not slot) { return; }

    if (slot->attempt) { slot->attempt->cancel.emit(boost::asio::cancellation_type::terminal); }
    if (not slot->connection or slot->endpoint_id) { return; }

    if (endpoint.active) {
      slot->endpoint_id = endpoint.id;
      return;
    }

    spdlog::info("[peer_manager] Closing legacy connection to {}; it now connects through endpoints", peer_id);
    auto connection = detach_connection(peer_id);
    publish(core::events::peer_status_changed{ .peer_id = peer_id, .status = core::connection_status::disconnected });
    boost::asio::co_spawn(*io_context_, close_detached(std::move(connection)), boost::asio::detached);
  }

  /// Cancels the peer's attempt in flight, if any, and waits until it has finished.
  auto abandon_attempt(const std::string &peer_id) -> boost::asio::awaitable<void>
  {
    auto slot = find_slot(peer_id);
    if (not slot or not slot->attempt) { co_return; }

    auto current = slot->attempt;
    spdlog::debug("[peer_manager] Abandoning connection attempt for {}", peer_id);
    current->cancel.emit(boost::asio::cancellation_type::terminal);
    co_await wait_for(current);
  }

  static auto wait_for(std::shared_ptr<attempt_state> current) -> boost::asio::awaitable<void>
  {
    if (current->finished) { co_return; }
    boost::system::error_code ignored;
    co_await current->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ignored));
  }

  /**
   * @brief Spawns the connection attempt for a peer, bound to the attempt's own cancellation signal.
   *
   * The slot forgets the attempt when it ends, however it ends.
   */
  auto start_attempt(const std::string &peer_id, const std::shared_ptr<peer_slot> &slot)
    -> std::shared_ptr<attempt_state>
  {
    auto current = std::make_shared<attempt_state>(*io_context_);
    slot->attempt = current;
    boost::asio::co_spawn(*io_context_,
      run_attempt(this->shared_from_this(), peer_id, slot),
      boost::asio::bind_cancellation_slot(current->cancel.slot(), [peer_id, slot, current](std::exception_ptr failure) {
        if (failure) { log_attempt_failure(peer_id, failure); }
        current->failure = failure;
        current->finished = true;
        if (slot->attempt == current) { slot->attempt.reset(); }
        current->done.cancel();
      }));
    return current;
  }

  static auto run_attempt(std::shared_ptr<peer_manager> self, std::string peer_id, std::shared_ptr<peer_slot> slot)
    -> boost::asio::awaitable<void>
  {
    // Cancellation is checked explicitly so the peer's status can be reset first.
    co_await boost::asio::this_coro::throw_if_cancelled(false);

    co_await self->reap_dead_connection(peer_id, *slot);
    const auto record = self->require_peer(peer_id);
    if (record.endpoints.empty()) {
      co_await self->connect_legacy(record, *slot);
    } else {
      co_await self->connect_fallback(record, *slot);
    }
  }

  static auto log_attempt_failure(const std::string &peer_id, const std::exception_ptr &failure) -> void
  {
    try {
      std::rethrow_exception(failure);
    } catch (const boost::system::system_error &error) {
      if (core::is_cancellation(error.code())) {
        spdlog::debug("[peer_manager] Attempt for {} cancelled", peer_id);
        return;
      }
      spdlog::warn("[peer_manager] Attempt for {} failed: {}", peer_id, error.what());
    } catch (const std::exception &error) {
      spdlog::warn("[peer_manager] Attempt for {} failed: {}", peer_id, error.what());
    }
  }

  /// The transport of an adopted connection dropped; the store stops reporting it connected.
  auto connection_lost(const std::string &peer_id, const agent_connection_t *lost) -> void
  {
    auto slot = find_slot(peer_id);
    if (not slot or slot->connection.get() != lost) { return; }

    spdlog::info("[peer_manager] Connection to {} was lost", peer_id);
    slot->connection.reset();
    slot->endpoint_id.reset();
    if (peers_->find(peer_id)) { set_status(peer_id, core::connection_status::disconnected); }
  }

  /// A cached connection whose transport closed underneath it is discarded and the store told.
  auto reap_dead_connection(const std::string &peer_id, peer_slot &slot) -> boost::asio::awaitable<void>
  {
    if (not slot.connection or slot.connection->is_connected()) { co_return; }

    spdlog::info("[peer_manager] Connection to {} was lost", peer_id);
    auto connection = std::exchange(slot.connection, nullptr);
    slot.endpoint_id.reset();
    co_await connection->disconnect();
    set_status(peer_id, core::connection_status::disconnected);
  }

  static auto cancellation_requested() -> boost::asio::awaitable<bool>
  {
    auto cancel_state = co_await boost::asio::this_coro::cancellation_state;
    co_return cancel_state.cancelled() != boost::asio::cancellation_type::none;
  }

  /// Runs connect(); a cancelled attempt leaves the peer disconnected and rethrows.
  auto establish(const core::peer &record, agent_connection_t &connection) -> boost::asio::awaitable<void>
  {
    std::exception_ptr cancelled;
    try {
      co_await connection.connect(record.session_id);
    } catch (const boost::system::system_error &) {
      cancelled = std::current_exception();
    }
    if (cancelled) {
      set_status(record.id, core::connection_status::disconnected);
      std::rethrow_exception(cancelled);
    }
  }

  static auto failure_message(const agent_connection_t &connection) -> std::string
  {
    if (const auto *failed = std::get_if<session::state::error>(&connection.state())) { return failed->message; }
    return "not connected";
  }

  auto make_connection(const core::connection_credentials &credentials) -> std::shared_ptr<agent_connection_t>
  {
    return std::make_shared<agent_connection_t>(
      io_context_, connector_, credentials, config_.profile, config_.working_directory);
  }

  auto adopt(const core::peer &record,
    peer_slot &slot,
    std::shared_ptr<agent_connection_t> connection,
    std::optional<core::transport_endpoint> via) -> void
  {
    slot.connection = std::move(connection);
    slot.endpoint_id = via ? std::optional<std::string>(via->id) : std::nullopt;
    slot.connection->set_disconnect_handler(
      [weak_self = this->weak_from_this(), peer_id = record.id, adopted = slot.connection.get()](const std::string &) {
        if (auto self = weak_self.lock()) { self->connection_lost(peer_id, adopted); }
      });

    if (via) {
      peers_->set_endpoint_active(record.id, via->id, true);
      publish(core::events::peer_status_changed{ .peer_id = record.id, .status = core::connection_status::connected });
    } else {
      set_status(record.id, core::connection_status::connected);
    }

    const auto &session_id = *slot.connection->session_id();
    peers_->update_session(record.id, session_id, slot.connection->supports_load_session());
    publish(core::events::peer_connected{ .peer_id = record.id,
      .via = via ? std::optional<core::transport_kind>(via->kind) : std::nullopt,
      .session_id = session_id,
      .resumed = slot.connection->resume_result() == session::resume_outcome::resumed });
  }

  auto connect_legacy(const core::peer &record, peer_slot &slot) -> boost::asio::awaitable<void>
  {
    auto credentials = credentials_->retrieve(record.id);
    if (not credentials) {
      spdlog::warn("[peer_manager] No stored credentials for {}", record.name);
      set_status(record.id, core::connection_status::disconnected);
      publish(core::events::peer_unreachable{ .peer_id = record.id, .error = "No stored credentials" });
      co_return;
    }

    spdlog::debug("[peer_manager] Connecting {} directly", record.name);
    auto connection = make_connection(*credentials);
    co_await establish(record, *connection);

    if (connection->is_connected()) {
      adopt(record, slot, std::move(connection), std::nullopt);
      co_return;
    }

    set_status(record.id, core::connection_status::disconnected);
    publish(core::events::peer_unreachable{ .peer_id = record.id, .error = failure_message(*connection) });
  }

  auto connect_fallback(const core::peer &record, peer_slot &slot) -> boost::asio::awaitable<void>
  {
    const auto legacy_credentials = credentials_->retrieve(record.id);
    std::string last_error{ "no endpoints" };

    set_status(record.id, core::connection_status::reconnecting);

    for (const auto &endpoint : core::connection_order(record)) {
      if (co_await cancellation_requested()) {
        set_status(record.id, core::connection_status::disconnected);
        throw boost::system::system_error(boost::asio::error::operation_aborted);
      }

      spdlog::debug("[peer_manager] Trying {} for {} at {}", core::to_string(endpoint.kind), record.name, endpoint.url);
      publish(core::events::endpoint_attempt{ .peer_id = record.id, .kind = endpoint.kind, .url = endpoint.url });

      auto credentials =
        core::credentials_for_endpoint(endpoint.url, credentials_->retrieve(endpoint.id), legacy_credentials);
      auto connection = make_connection(credentials);
      co_await establish(record, *connection);

      if (connection->is_connected()) {
        spdlog::info("[peer_manager] {} connected via {}", record.name, core::display_name(endpoint.kind));
        adopt(record, slot, std::move(connection), endpoint);
        co_return;
      }

      last_error = failure_message(*connection);
      spdlog::warn("[peer_manager] {} failed for {}: {}", core::to_string(endpoint.kind), record.name, last_error);
      peers_->set_endpoint_active(record.id, endpoint.id, false);
      publish(core::events::endpoint_failed{ .peer_id = record.id, .kind = endpoint.kind, .error = last_error });
    }

    set_status(record.id, core::connection_status::disconnected);
    publish(core::events::peer_unreachable{ .peer_id = record.id, .error = last_error });
  }

  auto reconnect_idle_peers(std::string_view reason) -> std::size_t
  {
    std::size_t started = 0;
    for (const auto &record : peers_->list()) {
      auto slot = slot_for(record.id);
      if (slot->attempt or live_connection(*slot)) { continue; }

      start_attempt(record.id, slot);
      ++started;
    }
    if (started > 0) { spdlog::debug("[peer_manager] {}: reconnecting {} peers", reason, started); }
    return started;
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Connector> connector_;
  std::shared_ptr<CredentialStore> credentials_;
  std::shared_ptr<PeerStore> peers_;
  std::shared_ptr<event_queue_t> events_;
  peer_manager_config config_;
  std::map<std::string, std::shared_ptr<peer_slot>> slots_;
};

}// namespace tether::registry
