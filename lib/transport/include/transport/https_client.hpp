#pragma once

#include <transport/http_types.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>

namespace tether::transport {

/**
 * @brief Minimal Beast-based HTTP/1.1 client used for pairing.
 *
 * https:// URLs are verified with the request's trust policy; http:// is sent in the clear.
 * The whole exchange (resolve, connect, handshake, write, read) shares the request timeout.
 */
class https_client
{
public:
  explicit https_client(const std::shared_ptr<boost::asio::io_context> &io_context);

  /**
   * @brief Performs a GET and returns the status and body.
   *
   * @throws boost::system::system_error on any transport failure
   */
  auto async_get(http_request request) -> boost::asio::awaitable<http_response>;

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
};

}// namespace tether::transport
