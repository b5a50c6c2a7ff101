#pragma once

#include <acp/types.hpp>
#include <concepts/protocol_connector.hpp>
#include <core/credentials.hpp>
#include <core/overload.hpp>
#include <security/fingerprint.hpp>
#include <session/connection_state.hpp>
#include <session/errors.hpp>
#include <session/permission_table.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_type.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <exception>
#include <fmt/format.h>
#include <functional>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tether::session {

/**
 * @brief Callbacks for one send_message() turn.
 *
 * on_complete fires exactly once per turn: with the stop reason, or std::nullopt when the turn
 * failed. It fires even when no streaming callback did.
 */
struct stream_callbacks
{
  std::function<void(const std::string &)> on_text;
  std::function<void(const std::string &)> on_thought;
  std::function<void(const acp::tool_call &)> on_tool_call;
  std::function<void(const acp::tool_call_update &)> on_tool_call_update;
  std::function<void(std::optional<std::string>)> on_complete;
};

/**
 * @brief Connection state machine for one peer over one credential set.
 *
 * Owns at most one protocol connection and session at a time. connect() retries transient
 * failures with a fixed backoff and never retries a certificate mismatch; exhausting the retries
 * is the only way into the error state. All members run on the io_context thread.
 *
 * @tparam Connector Protocol connector satisfying concepts::protocol_connector
 */
template<concepts::protocol_connector Connector>
class agent_connection : public std::enable_shared_from_this<agent_connection<Connector>>
{
public:
  using connection_t = typename Connector::connection_t;
  using permission_request_handler_t = std::function<void(const acp::permission_request &)>;
  using disconnect_handler_t = std::function<void(const std::string &reason)>;

  static constexpr auto default_allow_option = "allow_once";
  static constexpr auto default_reject_option = "reject_once";

  agent_connection(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<Connector> connector,
    core::connection_credentials credentials,
    connection_profile profile,
    std::string working_directory)
    : io_context_(io_context), connector_(std::move(connector)), credentials_(std::move(credentials)),
      profile_(profile), working_directory_(std::move(working_directory)),
      permissions_(std::make_shared<permission_table>(io_context))
  {}

  agent_connection(const agent_connection &) = delete;
  auto operator=(const agent_connection &) -> agent_connection & = delete;
  agent_connection(agent_connection &&) = delete;
  auto operator=(agent_connection &&) -> agent_connection & = delete;
  ~agent_connection() = default;

  /**
   * @brief Opens the transport, runs the handshake, then resumes or creates a session.
   *
   * A no-op when already connected. A call made while another connect() is in flight waits for
   * that one instead of opening a second connection. Failures end in state error(message) rather
   * than an exception.
   *
   * @param existing_session_id Session to resume when the agent supports it
   * @throws boost::system::system_error (operation_aborted) when cancelled; state is left as it was
   */
  auto connect(std::optional<std::string> existing_session_id = std::nullopt) -> boost::asio::awaitable<void>
  {
    if (is_connected()) { co_return; }

    if (in_flight_) {
      auto waiter = in_flight_;
      boost::system::error_code ignored;
      co_await waiter->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ignored));
      co_return;
    }

    in_flight_ = std::make_shared<boost::asio::steady_timer>(*io_context_, boost::asio::steady_timer::time_point::max());

    // Cancellation is checked explicitly so the state can be restored and the transport closed.
    const bool throw_if_cancelled = co_await boost::asio::this_coro::throw_if_cancelled();
    co_await boost::asio::this_coro::throw_if_cancelled(false);

    std::exception_ptr failure;
    try {
      co_await run_attempts(std::move(existing_session_id));
    } catch (const std::exception &) {
      failure = std::current_exception();
    }
    in_flight_->cancel();
    in_flight_.reset();
    co_await boost::asio::this_coro::throw_if_cancelled(throw_if_cancelled);

    if (failure) { std::rethrow_exception(failure); }
  }

  /**
   * @brief Closes the connection and forgets the session. Safe to call in any state.
   */
  auto disconnect() -> boost::asio::awaitable<void>
  {
    permissions_->cancel_all();
    session_id_.reset();
    resume_ = resume_outcome::not_attempted;
    fresh_session_ = false;
    state_ = state::disconnected{};

    if (auto connection = std::exchange(connection_, nullptr)) {
      spdlog::info("[connection] Disconnecting from {}", agent_name());
      co_await connection->close();
    }
  }

  /**
   * @brief Sends a prompt; results arrive through `callbacks`.
   *
   * @throws session_error (no_active_session) when not connected; nothing is sent
   */
  auto send_message(std::string text, stream_callbacks callbacks) -> void
  {
    if (not is_connected() or not session_id_) { throw session_error::no_active_session(); }

    auto turn = std::make_shared<stream_callbacks>(std::move(callbacks));
    active_turn_ = turn;
    boost::asio::co_spawn(*io_context_,
      run_turn(this->shared_from_this(), connection_, *session_id_, std::move(text), std::move(turn)),
      boost::asio::detached);
  }

  /**
   * @brief Called whenever the agent asks for approval; answer with approve_tool() or reject_tool().
   */
  auto set_permission_request_handler(permission_request_handler_t handler) -> void
  {
    permission_request_handler_ = std::move(handler);
  }

  /**
   * @brief Called when the transport of a connected session drops. The state is already
   * disconnected when it runs; the session id is kept so a later connect() can resume it.
   */
  auto set_disconnect_handler(disconnect_handler_t handler) -> void { disconnect_handler_ = std::move(handler); }

  /**
   * @throws session_error (unknown_tool_call) when nothing is pending for `tool_call_id`
   */
  auto approve_tool(const std::string &tool_call_id, const std::string &option_id = default_allow_option) -> void
  {
    permissions_->resolve(tool_call_id, acp::permission_outcome::selected(option_id));
  }

  /**
   * @throws session_error (unknown_tool_call) when nothing is pending for `tool_call_id`
   */
  auto reject_tool(const std::string &tool_call_id) -> void
  {
    permissions_->resolve(tool_call_id, acp::permission_outcome::selected(default_reject_option));
  }

  [[nodiscard]] auto permission_options(const std::string &tool_call_id) const
    -> std::optional<std::vector<acp::permission_option>>
  {
    return permissions_->options(tool_call_id);
  }

  [[nodiscard]] auto pending_permissions() const -> std::vector<std::string> { return permissions_->pending_ids(); }

  [[nodiscard]] auto state() const -> const connection_state & { return state_; }

  [[nodiscard]] auto is_connected() const -> bool
  {
    return std::holds_alternative<state::connected>(state_) and connection_ and connection_->is_open();
  }

  [[nodiscard]] auto session_id() const -> const std::optional<std::string> & { return session_id_; }
  [[nodiscard]] auto supports_load_session() const -> bool { return info_ and info_->supports_load_session; }
  [[nodiscard]] auto resume_result() const -> resume_outcome { return resume_; }

  /// True when the current session was created by this connect() rather than resumed.
  [[nodiscard]] auto is_fresh_session() const -> bool { return fresh_session_; }

  [[nodiscard]] auto agent_name() const -> std::string { return info_ ? info_->name : std::string{ "Agent" }; }
  [[nodiscard]] auto agent() const -> const std::optional<acp::agent_info> & { return info_; }
  [[nodiscard]] auto credentials() const -> const core::connection_credentials & { return credentials_; }

private:
  struct established
  {
    std::shared_ptr<connection_t> connection;
    acp::agent_info info;
    std::string session_id;
    resume_outcome resume{ resume_outcome::not_attempted };
  };

  static auto cancellation_requested() -> boost::asio::awaitable<bool>
  {
    auto cancel_state = co_await boost::asio::this_coro::cancellation_state;
    co_return cancel_state.cancelled() != boost::asio::cancellation_type::none;
  }

  static auto throw_cancelled() -> void
  {
    throw boost::system::system_error(boost::asio::error::operation_aborted);
  }

  auto run_attempts(std::optional<std::string> existing_session_id) -> boost::asio::awaitable<void>
  {
    const auto previous = state_;
    state_ = state::connecting{};
    std::string last_error{ "unknown error" };

    for (int attempt = 1; attempt <= profile_.max_retries; ++attempt) {
      if (co_await cancellation_requested()) {
        state_ = previous;
        throw_cancelled();
      }

      spdlog::debug("[connection] Attempt {}/{} to {}", attempt, profile_.max_retries, credentials_.url);

      std::shared_ptr<connection_t> opened;
      std::optional<established> result;
      std::optional<std::string> mismatch;
      try {
        opened = co_await connector_->open(credentials_, profile_.attempt_timeout);
        result = co_await handshake(opened, existing_session_id);
      } catch (const security::fingerprint_mismatch &error) {
        mismatch = error.what();
      } catch (const std::exception &error) {
        last_error = error.what();
      }

      if (co_await cancellation_requested()) {
        state_ = previous;
        if (opened) { co_await opened->close(); }
        throw_cancelled();
      }

      if (result) {
        commit(std::move(*result));
        co_return;
      }

      if (opened) { co_await opened->close(); }

      if (mismatch) {
        spdlog::error("[connection] {}", *mismatch);
        state_ = state::error{ *mismatch };
        co_return;
      }

      spdlog::warn("[connection] Attempt {}/{} failed: {}", attempt, profile_.max_retries, last_error);

      if (attempt < profile_.max_retries) {
        boost::asio::steady_timer backoff(*io_context_, profile_.retry_backoff);
        boost::system::error_code wait_error;
        co_await backoff.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));
      }
    }

    if (co_await cancellation_requested()) {
      state_ = previous;
      throw_cancelled();
    }
    state_ = state::error{ fmt::format("Failed after {} attempts: {}", profile_.max_retries, last_error) };
    spdlog::error("[connection] {}", std::get<state::error>(state_).message);
  }

  auto handshake(std::shared_ptr<connection_t> connection, const std::optional<std::string> &existing_session_id)
    -> boost::asio::awaitable<established>
  {
    install_handlers(*connection);

    established result{ .connection = connection, .info = co_await connection->initialize(), .session_id = {} };
    spdlog::debug("[connection] Handshake with {} (loadSession: {})", result.info.name, result.info.supports_load_session);
    if (co_await cancellation_requested()) { throw_cancelled(); }

    if (existing_session_id and result.info.supports_load_session) {
      bool loaded = false;
      try {
        co_await connection->load_session(*existing_session_id, working_directory_);
        loaded = true;
      } catch (const std::exception &error) {
        spdlog::warn("[connection] Could not resume session {}, starting a new one: {}", *existing_session_id, error.what());
      }
      result.resume = loaded ? resume_outcome::resumed : resume_outcome::failed;
      if (loaded) { result.session_id = *existing_session_id; }
    }

    if (co_await cancellation_requested()) { throw_cancelled(); }
    if (result.resume != resume_outcome::resumed) {
      result.session_id = co_await connection->new_session(working_directory_);
    }
    co_return result;
  }

  auto commit(established result) -> void
  {
    connection_ = std::move(result.connection);
    info_ = std::move(result.info);
    session_id_ = std::move(result.session_id);
    resume_ = result.resume;
    fresh_session_ = result.resume != resume_outcome::resumed;
    state_ = state::connected{};
    spdlog::info("[connection] Connected to {} ({} session {})",
      info_->name,
      fresh_session_ ? "new" : "resumed",
      *session_id_);
  }

  auto install_handlers(connection_t &connection) -> void
  {
    auto weak_self = this->weak_from_this();
    connection.set_update_handler([weak_self](const acp::session_update &update) {
      if (auto self = weak_self.lock()) { self->deliver(update); }
    });
    connection.set_permission_handler(
      [weak_self](acp::permission_request request) { return ask_user(weak_self, std::move(request)); });
    connection.set_close_handler([weak_self, closed = &connection](const std::string &reason) {
      if (auto self = weak_self.lock()) { self->transport_closed(closed, reason); }
    });
  }

  auto transport_closed(const connection_t *closed, const std::string &reason) -> void
  {
    if (connection_.get() != closed) { return; }

    spdlog::warn("[connection] Lost connection to {}: {}", agent_name(), reason);
    permissions_->cancel_all();
    connection_.reset();
    state_ = state::disconnected{};
    if (disconnect_handler_) { disconnect_handler_(reason); }
  }

  auto deliver(const acp::session_update &update) -> void
  {
    auto turn = active_turn_;
    if (not turn) { return; }

    std::visit(core::overload{
                 [&turn](const acp::message_chunk &chunk) {
                   if (turn->on_text) { turn->on_text(chunk.text); }
                 },
                 [&turn](const acp::thought_chunk &chunk) {
                   if (turn->on_thought) { turn->on_thought(chunk.text); }
                 },
                 [&turn](const acp::tool_call &call) {
                   if (turn->on_tool_call) { turn->on_tool_call(call); }
                 },
                 [&turn](const acp::tool_call_update &call_update) {
                   if (turn->on_tool_call_update) { turn->on_tool_call_update(call_update); }
                 },
               },
      update);
  }

  static auto ask_user(std::weak_ptr<agent_connection> weak_self, acp::permission_request request)
    -> boost::asio::awaitable<acp::permission_outcome>
  {
    auto self = weak_self.lock();
    if (not self) { co_return acp::permission_outcome::cancelled(); }

    spdlog::info("[connection] Permission requested for {}: {}", request.tool_call_id, request.title);
    auto table = self->permissions_;
    co_return co_await table->await_decision(
      std::move(request), self->profile_.permission_timeout, self->permission_request_handler_);
  }

  static auto run_turn(std::shared_ptr<agent_connection> self,
    std::shared_ptr<connection_t> connection,
    std::string session_id,
    std::string text,
    std::shared_ptr<stream_callbacks> turn) -> boost::asio::awaitable<void>
  {
    std::optional<std::string> stop_reason;
    try {
      stop_reason = co_await connection->prompt(std::move(session_id), std::move(text));
    } catch (const std::exception &error) {
      spdlog::warn("[connection] Prompt failed: {}", error.what());
    }

    if (self->active_turn_ == turn) { self->active_turn_.reset(); }
    if (turn->on_complete) { turn->on_complete(stop_reason); }
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Connector> connector_;
  core::connection_credentials credentials_;
  connection_profile profile_;
  std::string working_directory_;
  std::shared_ptr<permission_table> permissions_;

  connection_state state_{ state::disconnected{} };
  std::shared_ptr<connection_t> connection_;
  std::optional<acp::agent_info> info_;
  std::optional<std::string> session_id_;
  resume_outcome resume_{ resume_outcome::not_attempted };
  bool fresh_session_{ false };
  std::shared_ptr<stream_callbacks> active_turn_;
  std::shared_ptr<boost::asio::steady_timer> in_flight_;
  permission_request_handler_t permission_request_handler_;
  disconnect_handler_t disconnect_handler_;
};

}// namespace tether::session
