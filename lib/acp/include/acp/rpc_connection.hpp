#pragma once

#include <acp/protocol.hpp>
#include <acp/request_tracker.hpp>
#include <acp/types.hpp>
#include <async/oneshot.hpp>
#include <concepts/message_stream.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace tether::acp {

/**
 * @brief ACP client endpoint over one message stream.
 *
 * Sends JSON-RPC requests and matches their responses, forwards session/update notifications to
 * the update handler, and answers the agent's session/request_permission requests through the
 * permission handler. The agent's other client requests (file system, terminal) are refused with
 * method-not-found. All methods must be called from the io_context thread.
 *
 * @tparam Stream Message stream type satisfying concepts::message_stream
 */
template<concepts::message_stream Stream>
class rpc_connection : public std::enable_shared_from_this<rpc_connection<Stream>>
{
public:
  using update_handler_t = std::function<void(const session_update &)>;
  using permission_handler_t = std::function<boost::asio::awaitable<permission_outcome>(permission_request)>;
  using close_handler_t = std::function<void(const std::string &reason)>;

  rpc_connection(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<Stream> stream,
    std::chrono::milliseconds request_timeout)
    : io_context_(io_context), stream_(std::move(stream)), request_timeout_(request_timeout)
  {}

  rpc_connection(const rpc_connection &) = delete;
  auto operator=(const rpc_connection &) -> rpc_connection & = delete;
  rpc_connection(rpc_connection &&) = delete;
  auto operator=(rpc_connection &&) -> rpc_connection & = delete;
  ~rpc_connection() = default;

  /**
   * @brief Connects the stream and starts reading.
   *
   * @throws boost::system::system_error when the stream fails to connect
   */
  auto open(typename Stream::connection_params_t params) -> boost::asio::awaitable<void>
  {
    auto connected = std::make_shared<async::oneshot<boost::system::error_code>>(io_context_);
    stream_->async_connect(
      std::move(params), [connected](const boost::system::error_code &error) { connected->set_value(error); });

    const auto error = co_await connected->get();
    if (error) { throw boost::system::system_error(error); }

    open_ = true;
    read_next();
  }

  auto initialize() -> boost::asio::awaitable<agent_info>
  {
    auto result = co_await call(protocol::method::initialize, protocol::initialize_params());
    co_return protocol::parse_agent_info(result);
  }

  auto new_session(std::string working_directory) -> boost::asio::awaitable<std::string>
  {
    auto result = co_await call(protocol::method::session_new, protocol::new_session_params(working_directory));
    co_return protocol::parse_session_id(result);
  }

  auto load_session(std::string session_id, std::string working_directory) -> boost::asio::awaitable<void>
  {
    co_await call(protocol::method::session_load, protocol::load_session_params(session_id, working_directory));
  }

  /**
   * @brief Sends a prompt and waits for the turn to end.
   *
   * Updates for the turn arrive through the update handler before this completes.
   *
   * @return The stop reason
   */
  auto prompt(std::string session_id, std::string text) -> boost::asio::awaitable<std::string>
  {
    auto result = co_await call(protocol::method::session_prompt, protocol::prompt_params(session_id, text));
    co_return protocol::parse_stop_reason(result);
  }

  auto set_update_handler(update_handler_t handler) -> void { update_handler_ = std::move(handler); }
  auto set_permission_handler(permission_handler_t handler) -> void { permission_handler_ = std::move(handler); }

  /// Called once when the transport drops while open. Not called for close().
  auto set_close_handler(close_handler_t handler) -> void { close_handler_ = std::move(handler); }

  /**
   * @brief Fails outstanding requests and closes the stream. Safe to call more than once.
   */
  auto close() -> boost::asio::awaitable<void>
  {
    if (not open_) { co_return; }
    open_ = false;
    tracker_.fail_all("Connection closed");

    auto closed = std::make_shared<async::oneshot<boost::system::error_code>>(io_context_);
    stream_->async_close([closed](const boost::system::error_code &error) { closed->set_value(error); });
    const auto error = co_await closed->get();
    if (error) { spdlog::debug("[acp] Close completed with: {}", error.message()); }
  }

  [[nodiscard]] auto is_open() const -> bool { return open_; }

private:
  auto call(std::string_view method, nlohmann::json params) -> boost::asio::awaitable<nlohmann::json>
  {
    if (not open_) { throw std::runtime_error("Connection is not open"); }

    const auto id = next_id_++;
    spdlog::debug("[acp] -> {} (id {})", method, id);
    send(protocol::make_request(id, method, std::move(params)));
    co_return co_await tracker_.async_track(id, request_timeout_);
  }

  auto send(std::string message) -> void
  {
    outbox_.push_back(std::move(message));
    if (not writing_) { write_next(); }
  }

  auto write_next() -> void
  {
    writing_ = true;
    stream_->async_write(outbox_.front(), [self = this->shared_from_this()](const boost::system::error_code &error) {
      self->outbox_.pop_front();
      if (error) { spdlog::warn("[acp] Write failed: {}", error.message()); }
      if (self->outbox_.empty()) {
        self->writing_ = false;
        return;
      }
      self->write_next();
    });
  }

  auto read_next() -> void
  {
    stream_->async_read([self = this->shared_from_this()](const boost::system::error_code &error, std::string message) {
      if (error) {
        self->handle_stream_closed(error);
        return;
      }
      self->dispatch(message);
      if (self->open_) { self->read_next(); }
    });
  }

  auto handle_stream_closed(const boost::system::error_code &error) -> void
  {
    const bool was_open = open_;
    if (was_open) { spdlog::info("[acp] Connection closed: {}", error.message()); }
    open_ = false;
    tracker_.fail_all("Connection closed: " + error.message());
    if (was_open and close_handler_) { close_handler_(error.message()); }
  }

  auto dispatch(const std::string &raw) -> void
  {
    auto message = nlohmann::json::parse(raw, nullptr, false);
    if (message.is_discarded()) {
      spdlog::warn("[acp] Ignoring malformed message ({} bytes)", raw.size());
      return;
    }

    switch (protocol::classify(message)) {
    case protocol::message_kind::response:
      if (message.at("id").is_number_integer()) {
        tracker_.resolve(message.at("id").template get<std::int64_t>(), std::move(message));
      }
      break;
    case protocol::message_kind::notification:
      handle_notification(message);
      break;
    case protocol::message_kind::request:
      handle_request(message);
      break;
    case protocol::message_kind::invalid:
      spdlog::warn("[acp] Ignoring message that is neither request, response nor notification");
      break;
    }
  }

  auto handle_notification(const nlohmann::json &message) -> void
  {
    if (message.at("method") != protocol::method::session_update) {
      spdlog::debug("[acp] Ignoring notification {}", message.at("method").template get<std::string>());
      return;
    }
    auto update = protocol::parse_session_update(message.value("params", nlohmann::json::object()));
    if (update and update_handler_) { update_handler_(*update); }
  }

  auto handle_request(const nlohmann::json &message) -> void
  {
    const auto method = message.at("method").template get<std::string>();
    const auto &id = message.at("id");

    if (method != protocol::method::session_request_permission) {
      spdlog::debug("[acp] Refusing client request {}", method);
      send(protocol::make_error(id, protocol::method_not_found, "Method not found: " + method));
      return;
    }

    permission_request request;
    try {
      request = protocol::parse_permission_request(message.at("params"));
    } catch (const nlohmann::json::exception &error) {
      send(protocol::make_error(id, protocol::invalid_params, error.what()));
      return;
    }

    boost::asio::co_spawn(*io_context_,
      answer_permission(this->shared_from_this(), id, std::move(request)),
      boost::asio::detached);
  }

  static auto answer_permission(std::shared_ptr<rpc_connection> self, nlohmann::json id, permission_request request)
    -> boost::asio::awaitable<void>
  {
    auto outcome = permission_outcome::cancelled();
    if (self->permission_handler_) {
      try {
        outcome = co_await self->permission_handler_(std::move(request));
      } catch (const std::exception &error) {
        spdlog::warn("[acp] Permission handler failed, answering cancelled: {}", error.what());
      }
    }
    if (self->open_) { self->send(protocol::make_result(id, protocol::permission_response(outcome))); }
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Stream> stream_;
  std::chrono::milliseconds request_timeout_;
  request_tracker tracker_;
  std::int64_t next_id_{ 0 };
  bool open_{ false };
  bool writing_{ false };
  std::deque<std::string> outbox_;
  update_handler_t update_handler_;
  permission_handler_t permission_handler_;
  close_handler_t close_handler_;
};

}// namespace tether::acp
