#pragma once

#include <concepts/message_stream.hpp>
#include <transport/websocket_stream.hpp>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::test {

/**
 * @brief In-memory message stream.
 *
 * Inbound messages are queued with push_inbound() or produced by a responder that sees every
 * written message. All completions are posted to the io_context.
 */
class test_double_message_stream
{
public:
  using connection_params_t = transport::websocket_connection_params;
  using responder_t = std::function<std::vector<std::string>(const std::string &written)>;

  explicit test_double_message_stream(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context)
  {}

  auto set_connect_failure(bool fail) -> void { should_fail_connect_ = fail; }
  auto set_responder(responder_t responder) -> void { responder_ = std::move(responder); }

  auto push_inbound(std::string message) -> void
  {
    inbound_.push_back(std::move(message));
    complete_pending_read();
  }

  /// Completes the outstanding read with connection_reset, as a dropped transport would.
  auto drop() -> void
  {
    dropped_ = true;
    complete_pending_read();
  }

  [[nodiscard]] auto connections() const -> const std::vector<connection_params_t> & { return connections_; }
  [[nodiscard]] auto writes() const -> const std::vector<std::string> & { return writes_; }
  [[nodiscard]] auto is_connected() const -> bool { return connected_; }
  [[nodiscard]] auto close_count() const -> int { return close_count_; }

  auto async_connect(connection_params_t params, std::function<void(const boost::system::error_code &)> handler)
    -> void
  {
    connections_.push_back(std::move(params));
    boost::asio::post(*io_context_, [this, handler = std::move(handler)]() {
      if (should_fail_connect_) {
        handler(boost::asio::error::connection_refused);
        return;
      }
      connected_ = true;
      handler(boost::system::error_code{});
    });
  }

  auto async_write(std::string_view message, std::function<void(const boost::system::error_code &)> handler) -> void
  {
    writes_.emplace_back(message);
    const auto written = writes_.back();
    boost::asio::post(*io_context_, [this, written, handler = std::move(handler)]() {
      handler(boost::system::error_code{});
      if (responder_) {
        for (auto &reply : responder_(written)) { push_inbound(std::move(reply)); }
      }
    });
  }

  auto async_read(std::function<void(const boost::system::error_code &, std::string)> handler) -> void
  {
    pending_read_ = std::move(handler);
    complete_pending_read();
  }

  auto async_close(std::function<void(const boost::system::error_code &)> handler) -> void
  {
    ++close_count_;
    boost::asio::post(*io_context_, [this, handler = std::move(handler)]() {
      connected_ = false;
      dropped_ = true;
      complete_pending_read();
      handler(boost::system::error_code{});
    });
  }

private:
  auto complete_pending_read() -> void
  {
    if (not pending_read_) { return; }

    auto handler = std::exchange(pending_read_, nullptr);
    if (not inbound_.empty()) {
      auto message = std::move(inbound_.front());
      inbound_.pop_front();
      boost::asio::post(*io_context_, [handler = std::move(handler), message = std::move(message)]() mutable {
        handler(boost::system::error_code{}, std::move(message));
      });
      return;
    }

    if (dropped_) {
      boost::asio::post(*io_context_,
        [handler = std::move(handler)]() { handler(boost::asio::error::connection_reset, std::string{}); });
      return;
    }

    pending_read_ = std::move(handler);
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  bool should_fail_connect_{ false };
  bool connected_{ false };
  bool dropped_{ false };
  int close_count_{ 0 };
  responder_t responder_;
  std::vector<connection_params_t> connections_;
  std::vector<std::string> writes_;
  std::deque<std::string> inbound_;
  std::function<void(const boost::system::error_code &, std::string)> pending_read_;
};

static_assert(tether::concepts::message_stream<test_double_message_stream>);

}// namespace tether::test
