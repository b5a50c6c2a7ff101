#pragma once

#include <transport/http_types.hpp>

#include <boost/asio/awaitable.hpp>
#include <concepts>

namespace tether::concepts {

/**
 * @brief One-shot HTTP(S) GET, with the TLS trust decision carried by the request.
 *
 * Transport failures (DNS, TCP, TLS handshake, timeout) throw; any HTTP status is a normal result.
 */
template<typename T>
concept https_client = requires(T &client, transport::http_request request) {
  { client.async_get(request) } -> std::same_as<boost::asio::awaitable<transport::http_response>>;
};

}// namespace tether::concepts
