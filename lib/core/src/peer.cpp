#include <core/peer.hpp>

#include <platform/time_utils.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace tether::core {

namespace {
  auto kind_rank(transport_kind kind) -> std::ptrdiff_t
  {
    const auto found = std::find(all_transport_kinds.begin(), all_transport_kinds.end(), kind);
    return std::distance(all_transport_kinds.begin(), found);
  }

  auto lowercase(std::string_view text) -> std::string
  {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char character) {
      return static_cast<char>(std::tolower(character));
    });
    return result;
  }

  auto host_of(std::string_view url) -> std::string_view
  {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) { return {}; }
    auto rest = url.substr(scheme_end + 3);
    rest = rest.substr(0, rest.find_first_of("/?#"));
    if (const auto at = rest.rfind('@'); at != std::string_view::npos) { rest = rest.substr(at + 1); }
    if (rest.starts_with('[')) { return rest.substr(1, rest.find(']') - 1); }
    return rest.substr(0, rest.find(':'));
  }

  auto optional_time(const nlohmann::json &json, const char *key) -> std::optional<timestamp>
  {
    if (not json.contains(key) or json.at(key).is_null()) { return std::nullopt; }
    return platform::from_unix_seconds(json.at(key).get<std::int64_t>());
  }

  auto store_time(nlohmann::json &json, const char *key, const std::optional<timestamp> &value) -> void
  {
    if (value) { json[key] = platform::to_unix_seconds(*value); }
  }
}// namespace

auto to_string(connection_status status) -> std::string_view
{
  switch (status) {
  case connection_status::disconnected:
    return "disconnected";
  case connection_status::connected:
    return "connected";
  case connection_status::reconnecting:
    return "reconnecting";
  }
  return "unknown";
}

auto sorted_endpoints(const peer &record) -> std::vector<transport_endpoint>
{
  auto endpoints = record.endpoints;
  std::stable_sort(endpoints.begin(), endpoints.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.priority != rhs.priority) { return lhs.priority < rhs.priority; }
    return kind_rank(lhs.kind) < kind_rank(rhs.kind);
  });
  return endpoints;
}

auto connection_order(const peer &record) -> std::vector<transport_endpoint>
{
  auto endpoints = sorted_endpoints(record);
  if (not record.preferred_transport) { return endpoints; }

  const auto preferred = *record.preferred_transport;
  std::stable_partition(
    endpoints.begin(), endpoints.end(), [preferred](const auto &endpoint) { return endpoint.kind == preferred; });
  return endpoints;
}

auto active_endpoint(const peer &record) -> std::optional<transport_endpoint>
{
  const auto found =
    std::find_if(record.endpoints.begin(), record.endpoints.end(), [](const auto &endpoint) { return endpoint.active; });
  if (found == record.endpoints.end()) { return std::nullopt; }
  return *found;
}

auto status_consistent(const peer &record) -> bool
{
  const auto active_count =
    std::count_if(record.endpoints.begin(), record.endpoints.end(), [](const auto &endpoint) { return endpoint.active; });
  if (active_count > 1) { return false; }
  if (record.endpoints.empty()) { return true; }
  return (record.status == connection_status::connected) == (active_count == 1);
}

auto default_peer_name(std::string_view url) -> std::string
{
  const auto host = host_of(url);
  const auto label = host.substr(0, host.find('.'));
  if (label.empty()) { return "Unknown Agent"; }

  std::string name(label);
  name.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(name.front())));
  return name + " Agent";
}

auto normalize_url(std::string_view url) -> std::string
{
  while (url.ends_with('/')) { url.remove_suffix(1); }

  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) { return std::string(url); }

  const auto authority_end = url.find_first_of("/?#", scheme_end + 3);
  const auto head = url.substr(0, authority_end);
  const auto tail = authority_end == std::string_view::npos ? std::string_view{} : url.substr(authority_end);
  return lowercase(head) + std::string(tail);
}

auto to_json(nlohmann::json &json, const transport_endpoint &endpoint) -> void
{
  json = nlohmann::json{ { "id", endpoint.id },
    { "kind", std::string(to_string(endpoint.kind)) },
    { "url", endpoint.url },
    { "priority", endpoint.priority },
    { "active", endpoint.active } };
  store_time(json, "lastConnectedAt", endpoint.last_connected_at);
}

auto from_json(const nlohmann::json &json, transport_endpoint &endpoint) -> void
{
  const auto kind_name = json.at("kind").get<std::string>();
  const auto kind = parse_transport_kind(kind_name);
  if (not kind) { throw std::invalid_argument("Unknown transport kind: " + kind_name); }

  endpoint.id = json.at("id").get<std::string>();
  endpoint.kind = *kind;
  endpoint.url = json.at("url").get<std::string>();
  endpoint.priority = json.value("priority", default_priority(*kind));
  endpoint.active = json.value("active", false);
  endpoint.last_connected_at = optional_time(json, "lastConnectedAt");
}

auto to_json(nlohmann::json &json, const peer &record) -> void
{
  json = nlohmann::json{ { "id", record.id },
    { "name", record.name },
    { "url", record.url },
    { "status", std::string(to_string(record.status)) },
    { "endpoints", record.endpoints },
    { "supportsLoadSession", record.supports_load_session } };
  if (record.bridge_id) { json["bridgeId"] = *record.bridge_id; }
  if (record.preferred_transport) { json["preferredTransport"] = std::string(to_string(*record.preferred_transport)); }
  if (record.session_id) { json["sessionId"] = *record.session_id; }
  store_time(json, "sessionStartedAt", record.session_started_at);
  store_time(json, "lastConnectedAt", record.last_connected_at);
}

auto from_json(const nlohmann::json &json, peer &record) -> void
{
  record.id = json.at("id").get<std::string>();
  record.name = json.value("name", std::string{});
  record.url = json.value("url", std::string{});
  record.endpoints = json.value("endpoints", std::vector<transport_endpoint>{});
  record.supports_load_session = json.value("supportsLoadSession", false);
  record.bridge_id =
    json.contains("bridgeId") ? std::optional<std::string>(json.at("bridgeId").get<std::string>()) : std::nullopt;
  record.session_id =
    json.contains("sessionId") ? std::optional<std::string>(json.at("sessionId").get<std::string>()) : std::nullopt;
  record.preferred_transport = json.contains("preferredTransport")
                                 ? parse_transport_kind(json.at("preferredTransport").get<std::string>())
                                 : std::nullopt;
  record.session_started_at = optional_time(json, "sessionStartedAt");
  record.last_connected_at = optional_time(json, "lastConnectedAt");

  // A process that stopped while connected left stale live flags behind.
  record.status = connection_status::disconnected;
  for (auto &endpoint : record.endpoints) { endpoint.active = false; }
}

}// namespace tether::core
