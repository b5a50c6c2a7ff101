#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <memory>
#include <optional>

namespace tether::async {

/**
 * @brief Multi-producer event queue drained by a single coroutine.
 *
 * Used to hand peer-manager events to whatever is presenting them (the `watch` command).
 * Producers may live on any thread; pushes never block and are dropped once the queue is closed.
 *
 * @tparam T Element type
 */
template<typename T> class async_queue
{
public:
  /// Capacity of the underlying channel
  static constexpr std::size_t channel_size{ 1024 };

  explicit async_queue(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context), channel_(*io_context_, channel_size)
  {}

  async_queue(const async_queue &) = delete;
  auto operator=(const async_queue &) -> async_queue & = delete;
  async_queue(async_queue &&) = delete;
  auto operator=(async_queue &&) -> async_queue & = delete;
  ~async_queue() = default;

  /**
   * @brief Enqueues a value without waiting.
   *
   * @return false when the queue is closed or full and the value was dropped
   */
  auto push(T value) -> bool
  {
    if (not channel_.try_send(boost::system::error_code{}, std::move(value))) { return false; }
    ++size_;
    return true;
  }

  /**
   * @brief Waits for the next value.
   *
   * @param cancel_slot Optional slot used to abandon the wait
   * @throws boost::system::system_error when cancelled or closed
   */
  auto pop(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<T>
  {
    boost::system::error_code err;
    auto token = boost::asio::redirect_error(boost::asio::use_awaitable, err);

    auto value = cancel_slot
                   ? co_await channel_.async_receive(boost::asio::bind_cancellation_slot(*cancel_slot, token))
                   : co_await channel_.async_receive(token);
    if (err) { throw boost::system::system_error(err); }

    --size_;
    co_return value;
  }

  /// Takes the next value if one is ready.
  auto try_pop() -> std::optional<T>
  {
    std::optional<T> value;
    channel_.try_receive([&value](boost::system::error_code /*ec*/, T received) { value = std::move(received); });
    if (value) { --size_; }
    return value;
  }

  [[nodiscard]] auto empty() const -> bool { return size_.load() == 0; }
  [[nodiscard]] auto size() const -> std::size_t { return size_.load(); }

  /// Wakes any waiting pop() with channel_closed and rejects later pushes.
  auto close() -> void { channel_.close(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
  std::atomic<std::size_t> size_{ 0 };
};

}// namespace tether::async
