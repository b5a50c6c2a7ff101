#include <core/credentials.hpp>

#include <nlohmann/json.hpp>

namespace tether::core {

namespace {
  auto present(const std::optional<std::string> &value) -> bool { return value.has_value() and not value->empty(); }

  auto replace_prefix(const std::string &url, std::string_view from, std::string_view into) -> std::string
  {
    if (not url.starts_with(from)) { return url; }
    return std::string(into) + url.substr(from.size());
  }

  auto optional_field(const nlohmann::json &json, const char *key) -> std::optional<std::string>
  {
    if (not json.contains(key) or json.at(key).is_null()) { return std::nullopt; }
    return json.at(key).get<std::string>();
  }
}// namespace

auto connection_credentials::validate() const -> void
{
  if (url.empty()) { throw validation_error("Connection URL is empty"); }

  const bool known_scheme = url.starts_with("ws://") or url.starts_with("wss://") or url.starts_with("http://")
                            or url.starts_with("https://");
  if (not known_scheme) { throw validation_error("Invalid URL scheme: " + url); }

  if (protocol != "acp") { throw validation_error("Unsupported protocol: " + protocol); }

  if (url.starts_with("https://") and (not present(client_id) or not present(client_secret))) {
    throw validation_error("Gateway connections require client id and client secret");
  }
}

auto connection_credentials::websocket_url() const -> std::string
{
  if (url.starts_with("https://")) { return replace_prefix(url, "https://", "wss://"); }
  return replace_prefix(url, "http://", "ws://");
}

auto connection_credentials::has_pinned_certificate() const -> bool { return present(cert_fingerprint); }

auto credentials_for_endpoint(const std::string &endpoint_url,
  const std::optional<connection_credentials> &endpoint_secrets,
  const std::optional<connection_credentials> &peer_secrets) -> connection_credentials
{
  auto credentials = endpoint_secrets ? *endpoint_secrets : peer_secrets.value_or(connection_credentials{});
  credentials.url = endpoint_url;
  return credentials;
}

auto to_json(nlohmann::json &json, const connection_credentials &credentials) -> void
{
  json = nlohmann::json{ { "url", credentials.url },
    { "protocol", credentials.protocol },
    { "version", credentials.version } };
  if (credentials.auth_token) { json["authToken"] = *credentials.auth_token; }
  if (credentials.client_id) { json["clientId"] = *credentials.client_id; }
  if (credentials.client_secret) { json["clientSecret"] = *credentials.client_secret; }
  if (credentials.cert_fingerprint) { json["certFingerprint"] = *credentials.cert_fingerprint; }
}

auto from_json(const nlohmann::json &json, connection_credentials &credentials) -> void
{
  credentials.url = json.at("url").get<std::string>();
  credentials.protocol = json.value("protocol", std::string{ "acp" });
  credentials.version = json.value("version", std::string{ "1.0.0" });
  credentials.auth_token = optional_field(json, "authToken");
  credentials.client_id = optional_field(json, "clientId");
  credentials.client_secret = optional_field(json, "clientSecret");
  credentials.cert_fingerprint = optional_field(json, "certFingerprint");
}

}// namespace tether::core
