#pragma once

#include <concepts/https_client.hpp>
#include <security/trust_policy.hpp>
#include <transport/http_types.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/system/system_error.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tether::test {

/**
 * @brief Scripted HTTPS endpoint.
 *
 * A pinned request runs the server's certificate fingerprint through the request's validator,
 * the way a real TLS handshake would, and fails the handshake on mismatch.
 */
class test_double_https_client
{
public:
  auto set_response(unsigned status, std::string body) -> void
  {
    response_ = transport::http_response{ .status = status, .body = std::move(body) };
  }

  auto set_server_fingerprint(std::string fingerprint) -> void { server_fingerprint_ = std::move(fingerprint); }
  auto set_network_failure(bool fail) -> void { should_fail_network_ = fail; }

  [[nodiscard]] auto requests() const -> const std::vector<transport::http_request> & { return requests_; }

  auto async_get(transport::http_request request) -> boost::asio::awaitable<transport::http_response>
  {
    requests_.push_back(request);

    if (should_fail_network_) { throw boost::system::system_error(boost::asio::error::connection_refused); }

    if (auto validator = security::pinned_validator(request.trust); validator and server_fingerprint_) {
      if (not validator->check(*server_fingerprint_)) {
        throw boost::system::system_error(boost::asio::ssl::error::unspecified_system_error, "handshake failed");
      }
    }

    co_return response_;
  }

private:
  transport::http_response response_{ .status = 200, .body = "{}" };
  std::optional<std::string> server_fingerprint_;
  bool should_fail_network_{ false };
  std::vector<transport::http_request> requests_;
};

static_assert(tether::concepts::https_client<test_double_https_client>);

}// namespace tether::test
