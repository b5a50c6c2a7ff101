#include <transport/websocket_stream.hpp>

#include "internal_use_only/config.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tether::transport {

websocket_stream::websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context)
  : ssl_context_(security::make_client_context()), resolver_(*io_context),
    resolve_deadline_(io_context->get_executor(), [this]() { resolver_.cancel(); }),
    ws_(boost::asio::make_strand(*io_context), ssl_context_)
{}

auto websocket_stream::async_connect(websocket_connection_params params,
  std::function<void(const boost::system::error_code &)> handler) -> void
{
  namespace beast = boost::beast;

  security::apply_trust_policy(params.trust, ws_.next_layer(), params.host);

  auto shared_params = std::make_shared<websocket_connection_params>(std::move(params));

  resolve_deadline_.arm(shared_params->timeout);
  resolver_.async_resolve(shared_params->host,
    shared_params->port,
    [this, shared_params, handler = std::move(handler)](const boost::system::error_code &error_code,
      const boost::asio::ip::tcp::resolver::results_type &results) mutable {
      resolve_deadline_.disarm();
      if (resolve_deadline_.expired()) {
        handler(beast::error::timeout);
        return;
      }
      if (error_code) {
        handler(error_code);
        return;
      }

      beast::get_lowest_layer(ws_).expires_after(shared_params->timeout);

      beast::get_lowest_layer(ws_).async_connect(results,
        [this, shared_params, handler = std::move(handler)](
          const boost::system::error_code &connect_error, const boost::asio::ip::tcp::endpoint & /*endpoint*/) mutable {
          if (connect_error) {
            handler(connect_error);
            return;
          }

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast,hicpp-no-array-decay)
          if (not SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), shared_params->host.c_str())) {
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
            handler(boost::asio::error::operation_not_supported);
            return;
          }

          ws_.next_layer().async_handshake(boost::asio::ssl::stream_base::client,
            [this, shared_params, handler = std::move(handler)](const boost::system::error_code &ssl_error) mutable {
              if (ssl_error) {
                handler(ssl_error);
                return;
              }

              beast::get_lowest_layer(ws_).expires_never();

              auto timeouts = beast::websocket::stream_base::timeout::suggested(beast::role_type::client);
              timeouts.handshake_timeout = shared_params->timeout;
              ws_.set_option(timeouts);

              ws_.set_option(beast::websocket::stream_base::decorator(
                [headers = shared_params->headers](beast::websocket::request_type &req) {
                  req.set(boost::beast::http::field::user_agent,
                    fmt::format("{} tether/{}", BOOST_BEAST_VERSION_STRING, cmake::project_version));
                  for (const auto &[name, value] : headers) { req.set(name, value); }
                }));

              ws_.async_handshake(shared_params->host,
                shared_params->path,
                [shared_params, handler = std::move(handler)](const boost::system::error_code &ws_error) {
                  if (not ws_error) {
                    spdlog::debug("[websocket] Connected to {}:{}{}",
                      shared_params->host,
                      shared_params->port,
                      shared_params->path);
                  }
                  handler(ws_error);
                });
            });
        });
    });
}

auto websocket_stream::async_write(std::string_view message,
  std::function<void(const boost::system::error_code &)> handler) -> void
{
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(message.data(), message.size()),
    [handler = std::move(handler)](const boost::system::error_code &error_code, std::size_t bytes_transferred) {
      spdlog::trace("[websocket] Wrote {} bytes", bytes_transferred);
      handler(error_code);
    });
}

auto websocket_stream::async_read(std::function<void(const boost::system::error_code &, std::string)> handler) -> void
{
  read_buffer_.clear();
  ws_.async_read(read_buffer_,
    [this, handler = std::move(handler)](const boost::system::error_code &error_code, std::size_t bytes_transferred) {
      if (error_code) {
        handler(error_code, {});
        return;
      }
      spdlog::trace("[websocket] Read {} bytes", bytes_transferred);
      handler(error_code, boost::beast::buffers_to_string(read_buffer_.data()));
    });
}

auto websocket_stream::async_close(std::function<void(const boost::system::error_code &)> handler) -> void
{
  ws_.async_close(boost::beast::websocket::close_code::normal,
    [handler = std::move(handler)](const boost::system::error_code &error_code) { handler(error_code); });
}

}// namespace tether::transport
