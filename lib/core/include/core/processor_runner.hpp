#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <concepts>
#include <memory>
#include <spdlog/spdlog.h>
#include <string_view>
#include <utility>

namespace tether::core {

/**
 * @brief A long-running loop that stops when its cancellation slot fires.
 */
template<typename T>
concept Processor = requires(T proc, std::shared_ptr<boost::asio::cancellation_slot> slot) {
  { proc.run(slot) } -> std::same_as<boost::asio::awaitable<void>>;
};

/// True for the error codes a cancelled wait or a closed queue completes with.
inline auto is_cancellation(const boost::system::error_code &code) -> bool
{
  return code == boost::asio::error::operation_aborted or code == boost::asio::experimental::error::channel_cancelled
         or code == boost::asio::experimental::error::channel_closed;
}

/**
 * @brief Runs a processor, treating cancellation as a normal exit.
 */
template<Processor P>
auto run_processor(std::shared_ptr<P> proc,
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot,
  std::string_view processor_name) -> boost::asio::awaitable<void>
{
  spdlog::trace("[{}] Coroutine started", processor_name);
  try {
    co_await proc->run(cancel_slot);
  } catch (const boost::system::system_error &err) {
    if (is_cancellation(err.code())) {
      spdlog::debug("[{}] Cancelled, exiting run loop", processor_name);
      co_return;
    }
    spdlog::error("[{}] Unexpected error in run loop: {}", processor_name, err.what());
  } catch (const std::exception &err) {
    spdlog::error("[{}] Unknown exception in run loop: {}", processor_name, err.what());
  }
  spdlog::trace("[{}] Coroutine exiting", processor_name);
}

/**
 * @brief Spawns a processor detached on the io_context; it runs until `cancel_slot` fires.
 */
template<Processor P>
auto spawn_processor(const std::shared_ptr<boost::asio::io_context> &io_context,
  std::shared_ptr<P> proc,
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot,
  std::string_view processor_name) -> void
{
  boost::asio::co_spawn(*io_context, run_processor(std::move(proc), std::move(cancel_slot), processor_name), boost::asio::detached);
}

}// namespace tether::core
