#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <memory>

namespace tether::async {

/**
 * @brief Single-assignment result channel.
 *
 * One side awaits get(); the other side calls set_value() exactly once. Later set_value()
 * calls are rejected so a result cannot be delivered twice. set_value() may be called from
 * any thread.
 *
 * @tparam T Result type
 */
template<typename T> class oneshot
{
public:
  explicit oneshot(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context), channel_(*io_context_, 1)
  {}

  oneshot(const oneshot &) = delete;
  auto operator=(const oneshot &) -> oneshot & = delete;
  oneshot(oneshot &&) = delete;
  auto operator=(oneshot &&) -> oneshot & = delete;
  ~oneshot() = default;

  /**
   * @brief Delivers the result.
   *
   * @return true if this call delivered the result, false if it was already set or the channel closed
   */
  auto set_value(T value) -> bool
  {
    if (fulfilled_.exchange(true)) { return false; }
    return channel_.try_send(boost::system::error_code{}, std::move(value));
  }

  /**
   * @brief Suspends until the result is delivered.
   *
   * @throws boost::system::system_error if the channel is closed first
   */
  auto get() -> boost::asio::awaitable<T>
  {
    boost::system::error_code err;
    auto value = co_await channel_.async_receive(boost::asio::redirect_error(boost::asio::use_awaitable, err));
    if (err) { throw boost::system::system_error(err); }
    co_return value;
  }

  [[nodiscard]] auto is_fulfilled() const -> bool { return fulfilled_.load(); }

  auto close() -> void { channel_.close(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
  std::atomic<bool> fulfilled_{ false };
};

}// namespace tether::async
