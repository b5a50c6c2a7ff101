#include <acp/connector.hpp>

#include <concepts/protocol_connector.hpp>
#include <security/trust_policy.hpp>
#include <transport/endpoint_url.hpp>

#include <exception>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace tether::acp {

static_assert(concepts::protocol_connector<websocket_connector>);

auto auth_headers(const core::connection_credentials &credentials) -> std::vector<std::pair<std::string, std::string>>
{
  std::vector<std::pair<std::string, std::string>> headers;
  if (credentials.auth_token and not credentials.auth_token->empty()) {
    headers.emplace_back("Authorization", "Bearer " + *credentials.auth_token);
  }
  if (credentials.client_id and not credentials.client_id->empty()) {
    headers.emplace_back("CF-Access-Client-Id", *credentials.client_id);
  }
  if (credentials.client_secret and not credentials.client_secret->empty()) {
    headers.emplace_back("CF-Access-Client-Secret", *credentials.client_secret);
  }
  return headers;
}

websocket_connector::websocket_connector(const std::shared_ptr<boost::asio::io_context> &io_context)
  : io_context_(io_context)
{}

auto websocket_connector::open(const core::connection_credentials &credentials, std::chrono::milliseconds timeout)
  -> boost::asio::awaitable<std::shared_ptr<connection_t>>
{
  const auto url = transport::parse_endpoint_url(credentials.websocket_url());
  if (not url.is_secure()) {
    throw std::invalid_argument("Insecure WebSocket (ws://) not supported. Use wss:// for security.");
  }

  transport::websocket_connection_params params{ .host = url.host,
    .port = url.port,
    .path = url.target,
    .headers = auth_headers(credentials),
    .trust = security::make_trust_policy(credentials.cert_fingerprint),
    .timeout = std::chrono::ceil<std::chrono::seconds>(timeout) };
  const auto validator = security::pinned_validator(params.trust);

  spdlog::debug("[acp] Opening {}:{} using {}", url.host, url.port, security::describe(params.trust));

  auto connection = std::make_shared<connection_t>(
    io_context_, std::make_shared<transport::websocket_stream>(io_context_), timeout);

  std::exception_ptr failure;
  try {
    co_await connection->open(std::move(params));
  } catch (const std::exception &) {
    failure = std::current_exception();
  }

  if (failure) {
    if (validator and validator->mismatch_detected()) { throw validator->mismatch_error(); }
    std::rethrow_exception(failure);
  }
  co_return connection;
}

}// namespace tether::acp
