#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace tether::transport {

/**
 * @brief Bounds an operation that has no timeout of its own, such as a DNS lookup.
 *
 * When the deadline passes before disarm(), `on_expiry` runs (typically cancelling the operation)
 * and expired() turns true, which tells a timeout apart from any other cancellation.
 */
class operation_deadline
{
public:
  operation_deadline(const boost::asio::any_io_executor &executor, std::function<void()> on_expiry);

  operation_deadline(const operation_deadline &) = delete;
  auto operator=(const operation_deadline &) -> operation_deadline & = delete;
  operation_deadline(operation_deadline &&) = delete;
  auto operator=(operation_deadline &&) -> operation_deadline & = delete;
  ~operation_deadline();

  auto arm(std::chrono::steady_clock::duration timeout) -> void;
  auto disarm() -> void;

  [[nodiscard]] auto expired() const -> bool { return state_->expired; }

private:
  struct state
  {
    std::function<void()> on_expiry;
    bool armed{ false };
    bool expired{ false };
  };

  boost::asio::steady_timer timer_;
  std::shared_ptr<state> state_;
};

}// namespace tether::transport
