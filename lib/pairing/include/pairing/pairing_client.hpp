#pragma once

#include <concepts/https_client.hpp>
#include <core/credentials.hpp>
#include <pairing/errors.hpp>
#include <pairing/pairing_response.hpp>
#include <pairing/pairing_url.hpp>
#include <security/fingerprint.hpp>
#include <security/trust_policy.hpp>
#include <transport/http_types.hpp>

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace tether::pairing {

/**
 * @brief Exchanges a one-time pairing code for durable credentials.
 *
 * One GET per call and no retries: a stale code must not be replayed against a server that
 * enforces expiry and attempt limits.
 *
 * @tparam Client HTTPS client type satisfying concepts::https_client
 */
template<concepts::https_client Client> class pairing_client
{
public:
  static constexpr auto request_timeout = std::chrono::seconds(30);

  static constexpr unsigned status_ok = 200;
  static constexpr unsigned status_unauthorized = 401;
  static constexpr unsigned status_too_many_requests = 429;

  explicit pairing_client(std::shared_ptr<Client> http) : http_(std::move(http)) {}

  /**
   * @brief Performs the exchange.
   *
   * @param descriptor Parsed pairing URL; consumed by this call
   * @return Credentials issued by the bridge
   * @throws pairing_error for every failure, fingerprint_mismatch when a pinned handshake saw
   *         a different certificate
   */
  auto pair(const pairing_descriptor &descriptor) -> boost::asio::awaitable<core::connection_credentials>
  {
    const auto kind = descriptor.transport();
    if (not kind) { throw pairing_error::unsupported_kind(descriptor.kind_name); }
    if (core::uses_pinning(*kind) and not descriptor.fingerprint) { throw pairing_error::missing_fingerprint(); }

    const auto trust = security::trust_policy_for(*kind, descriptor.fingerprint);
    const auto validator = security::pinned_validator(trust);

    spdlog::info("[pairing] Pairing over {} using {}", core::to_string(*kind), security::describe(trust));

    transport::http_response response;
    std::optional<std::string> failure;
    try {
      response = co_await http_->async_get(
        transport::http_request{ .url = descriptor.full_url, .trust = trust, .timeout = request_timeout, .headers = {} });
    } catch (const std::exception &error) {
      failure = error.what();
    }

    if (failure) {
      if (validator and validator->mismatch_detected()) {
        spdlog::error("[pairing] Certificate fingerprint mismatch for {}", descriptor.base_url);
        throw pairing_error::fingerprint_mismatch(validator->expected(), validator->received().value_or(""));
      }
      spdlog::warn("[pairing] Request failed: {}", *failure);
      throw pairing_error::network(*failure);
    }

    spdlog::debug("[pairing] HTTP status {}", response.status);

    switch (response.status) {
    case status_ok: {
      auto credentials = decode_pairing_response(*kind, response.body);
      if (not credentials.cert_fingerprint and core::uses_pinning(*kind)) {
        credentials.cert_fingerprint = descriptor.fingerprint;
      }
      spdlog::info("[pairing] Paired with {}", credentials.url);
      co_return credentials;
    }
    case status_unauthorized:
      throw pairing_error::invalid_code();
    case status_too_many_requests:
      throw pairing_error::rate_limited();
    default:
      break;
    }

    if (auto message = extract_server_message(response.body)) {
      throw pairing_error::invalid_response(fmt::format("Server error: {}", *message));
    }
    throw pairing_error::invalid_response(fmt::format("HTTP {}", response.status));
  }

private:
  std::shared_ptr<Client> http_;
};

}// namespace tether::pairing
