#pragma once

#include <boost/system/error_code.hpp>
#include <concepts>
#include <functional>
#include <string>
#include <string_view>

namespace tether::concepts {

/**
 * @brief Message-oriented duplex stream (one complete text frame per read).
 *
 * Each stream type names the parameters it connects with via `connection_params_t`.
 * Only one write may be outstanding at a time; callers queue their own writes. The data passed
 * to async_write must stay alive until its handler runs.
 */
template<typename T>
concept message_stream = requires(T &stream,
  typename T::connection_params_t params,
  std::string_view message,
  std::function<void(const boost::system::error_code &)> handler,
  std::function<void(const boost::system::error_code &, std::string)> read_handler) {
  typename T::connection_params_t;
  { stream.async_connect(params, handler) } -> std::same_as<void>;
  { stream.async_write(message, handler) } -> std::same_as<void>;
  { stream.async_read(read_handler) } -> std::same_as<void>;
  { stream.async_close(handler) } -> std::same_as<void>;
};

}// namespace tether::concepts
