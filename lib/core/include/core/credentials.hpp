#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace tether::core {

/**
 * @brief Raised when credentials are structurally unusable.
 */
class validation_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Address and secrets for reaching a peer over one transport.
 *
 * Issued by pairing. Re-pairing supersedes a set wholesale; fields are never patched one at a time.
 */
struct connection_credentials
{
  std::string url;///< ws://, wss://, http:// or https:// endpoint
  std::optional<std::string> auth_token;///< Bearer token
  std::optional<std::string> client_id;///< Access gateway client id
  std::optional<std::string> client_secret;///< Access gateway client secret
  std::optional<std::string> cert_fingerprint;///< Set only for self-signed transports
  std::string protocol{ "acp" };
  std::string version{ "1.0.0" };

  /**
   * @brief Checks the credentials can be used to open a connection.
   *
   * @throws validation_error naming the first problem found
   */
  auto validate() const -> void;

  /// URL with https→wss and http→ws applied.
  [[nodiscard]] auto websocket_url() const -> std::string;

  [[nodiscard]] auto has_pinned_certificate() const -> bool;

  auto operator==(const connection_credentials &) const -> bool = default;
};

/**
 * @brief Credentials for one endpoint of a peer.
 *
 * The endpoint's own URL always wins; secrets come from what was stored for the endpoint,
 * falling back to the peer's legacy set when the endpoint has none of its own.
 */
[[nodiscard]] auto credentials_for_endpoint(const std::string &endpoint_url,
  const std::optional<connection_credentials> &endpoint_secrets,
  const std::optional<connection_credentials> &peer_secrets) -> connection_credentials;

auto to_json(nlohmann::json &json, const connection_credentials &credentials) -> void;
auto from_json(const nlohmann::json &json, connection_credentials &credentials) -> void;

}// namespace tether::core
