#pragma once

#include <core/transport_kind.hpp>
#include <security/fingerprint.hpp>

#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/verify_mode.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tether::security {

/// Public CA trust with host name verification.
struct system_trust
{
};

/// Exact-match trust on the leaf certificate fingerprint.
struct pinned_trust
{
  std::shared_ptr<fingerprint_validator> validator;
};

/**
 * @brief How a TLS peer is trusted on one connection.
 *
 * A fresh policy (and validator) is built per connection so the received fingerprint observed by
 * one handshake never leaks into another.
 */
using trust_policy = std::variant<system_trust, pinned_trust>;

/**
 * @brief Policy implied by a credential set: pinned when a fingerprint is present, system trust otherwise.
 */
[[nodiscard]] auto make_trust_policy(const std::optional<std::string> &fingerprint) -> trust_policy;

/**
 * @brief Policy for a transport kind.
 *
 * @throws std::invalid_argument when a pinned kind is given no fingerprint
 */
[[nodiscard]] auto trust_policy_for(core::transport_kind kind, const std::optional<std::string> &fingerprint)
  -> trust_policy;

/// The validator of a pinned policy, nullptr for system trust.
[[nodiscard]] auto pinned_validator(const trust_policy &policy) -> std::shared_ptr<fingerprint_validator>;

[[nodiscard]] auto describe(const trust_policy &policy) -> std::string_view;

/// Base TLS client context shared by the HTTPS client and websocket stream.
[[nodiscard]] auto make_client_context() -> boost::asio::ssl::context;

/**
 * @brief Installs the policy's verification on a TLS stream before its handshake.
 *
 * @param stream Any Asio/Beast TLS stream exposing set_verify_mode/set_verify_callback
 * @param host Expected server name for system trust
 */
template<typename TlsStream>
auto apply_trust_policy(const trust_policy &policy, TlsStream &stream, const std::string &host) -> void
{
  stream.set_verify_mode(boost::asio::ssl::verify_peer);

  if (auto validator = pinned_validator(policy)) {
    stream.set_verify_callback([validator](bool preverified, boost::asio::ssl::verify_context &context) {
      return validator->verify(preverified, context);
    });
    return;
  }

  stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));
}

}// namespace tether::security
