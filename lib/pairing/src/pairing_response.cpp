#include <pairing/pairing_response.hpp>

#include <pairing/errors.hpp>

#include <nlohmann/json.hpp>

namespace tether::pairing {

namespace {
  auto required_string(const nlohmann::json &json, const char *key) -> std::string
  {
    if (not json.contains(key) or not json.at(key).is_string()) {
      throw pairing_error::invalid_response(std::string("Could not parse response: missing ") + key);
    }
    return json.at(key).get<std::string>();
  }

  auto optional_string(const nlohmann::json &json, const char *key) -> std::optional<std::string>
  {
    if (not json.contains(key) or not json.at(key).is_string()) { return std::nullopt; }
    auto value = json.at(key).get<std::string>();
    if (value.empty()) { return std::nullopt; }
    return value;
  }
}// namespace

auto decode_pairing_response(core::transport_kind kind, std::string_view body) -> core::connection_credentials
{
  const auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() or not json.is_object()) {
    throw pairing_error::invalid_response("Could not parse response: body is not a JSON object");
  }

  core::connection_credentials credentials;
  credentials.url = required_string(json, "url");
  credentials.auth_token = required_string(json, "authToken");
  credentials.protocol = optional_string(json, "protocol").value_or("acp");
  credentials.version = optional_string(json, "version").value_or("1.0.0");

  if (kind == core::transport_kind::relay_gateway) {
    credentials.client_id = required_string(json, "clientId");
    credentials.client_secret = required_string(json, "clientSecret");
  } else {
    credentials.cert_fingerprint = optional_string(json, "certFingerprint");
  }

  try {
    credentials.validate();
  } catch (const core::validation_error &error) {
    throw pairing_error::invalid_response(error.what());
  }
  return credentials;
}

auto extract_server_message(std::string_view body) -> std::optional<std::string>
{
  const auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() or not json.is_object()) { return std::nullopt; }
  return optional_string(json, "message");
}

}// namespace tether::pairing
