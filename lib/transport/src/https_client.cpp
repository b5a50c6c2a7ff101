#include <transport/https_client.hpp>

#include <transport/endpoint_url.hpp>
#include <transport/operation_deadline.hpp>

#include "internal_use_only/config.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tether::transport {

namespace {
  namespace beast = boost::beast;
  namespace http = boost::beast::http;

  template<typename Stream>
  auto exchange(Stream &stream, const http::request<http::empty_body> &request) -> boost::asio::awaitable<http_response>
  {
    co_await http::async_write(stream, request, boost::asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    co_await http::async_read(stream, buffer, response, boost::asio::use_awaitable);

    co_return http_response{ .status = response.result_int(), .body = std::move(response.body()) };
  }
}// namespace

https_client::https_client(const std::shared_ptr<boost::asio::io_context> &io_context) : io_context_(io_context) {}

auto https_client::async_get(http_request request) -> boost::asio::awaitable<http_response>
{
  const auto url = parse_endpoint_url(request.url);
  auto executor = co_await boost::asio::this_coro::executor;

  boost::asio::ip::tcp::resolver resolver(executor);
  operation_deadline resolve_deadline(executor, [&resolver]() { resolver.cancel(); });
  resolve_deadline.arm(request.timeout);
  boost::system::error_code resolve_error;
  const auto results = co_await resolver.async_resolve(
    url.host, url.port, boost::asio::redirect_error(boost::asio::use_awaitable, resolve_error));
  resolve_deadline.disarm();
  if (resolve_deadline.expired()) { throw boost::system::system_error(beast::error::timeout); }
  if (resolve_error) { throw boost::system::system_error(resolve_error); }

  http::request<http::empty_body> get{ http::verb::get, url.target, 11 };
  get.set(http::field::host, url.host);
  get.set(http::field::user_agent, fmt::format("tether/{}", cmake::project_version));
  get.set(http::field::accept, "application/json");
  for (const auto &[name, value] : request.headers) { get.set(name, value); }

  spdlog::debug("[https] GET {}://{}:{}{}", url.scheme, url.host, url.port, url.target);

  if (not url.is_secure()) {
    beast::tcp_stream stream(executor);
    stream.expires_after(request.timeout);
    co_await stream.async_connect(results, boost::asio::use_awaitable);
    auto response = co_await transport::exchange(stream, get);

    boost::system::error_code ignored;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    co_return response;
  }

  auto ssl_context = security::make_client_context();
  beast::ssl_stream<beast::tcp_stream> stream(executor, ssl_context);
  security::apply_trust_policy(request.trust, stream, url.host);

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast,hicpp-no-array-decay)
  if (not SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
    throw boost::system::system_error(
      boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()));
  }

  beast::get_lowest_layer(stream).expires_after(request.timeout);
  co_await beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);
  co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);

  auto response = co_await transport::exchange(stream, get);

  // Many servers close without a close_notify; the response is already complete.
  boost::system::error_code shutdown_error;
  co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, shutdown_error));
  if (shutdown_error and shutdown_error != boost::asio::ssl::error::stream_truncated) {
    spdlog::trace("[https] TLS shutdown: {}", shutdown_error.message());
  }

  co_return response;
}

}// namespace tether::transport
