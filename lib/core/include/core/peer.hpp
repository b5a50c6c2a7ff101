#pragma once

#include <core/transport_kind.hpp>

#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::core {

using timestamp = std::chrono::system_clock::time_point;

enum class connection_status : std::uint8_t { disconnected, connected, reconnecting };

[[nodiscard]] auto to_string(connection_status status) -> std::string_view;

/**
 * @brief One registered way of reaching a peer.
 *
 * At most one endpoint per (peer, kind). Secrets for the endpoint are kept in the credential
 * store under the endpoint id.
 */
struct transport_endpoint
{
  std::string id;
  transport_kind kind{ transport_kind::direct_pinned };
  std::string url;
  int priority{ 0 };///< Lower is tried first
  bool active{ false };///< True only while a live connection runs through this endpoint
  std::optional<timestamp> last_connected_at;

  auto operator==(const transport_endpoint &) const -> bool = default;
};

/**
 * @brief A paired agent.
 *
 * `status` is derived from the endpoint `active` flags: connected exactly when one endpoint is
 * active. Peers paired before endpoints existed ("legacy" peers) have no endpoints and carry their
 * status directly.
 */
struct peer
{
  std::string id;
  std::optional<std::string> bridge_id;///< Stable id issued by the bridge, shared across transports
  std::string name;
  std::string url;///< Legacy single-endpoint URL
  connection_status status{ connection_status::disconnected };
  std::vector<transport_endpoint> endpoints;
  std::optional<transport_kind> preferred_transport;
  std::optional<std::string> session_id;
  std::optional<timestamp> session_started_at;
  bool supports_load_session{ false };
  std::optional<timestamp> last_connected_at;

  auto operator==(const peer &) const -> bool = default;
};

/// Endpoints ordered by ascending priority, ties broken by kind order.
[[nodiscard]] auto sorted_endpoints(const peer &record) -> std::vector<transport_endpoint>;

/// Connection order: sorted endpoints with the preferred kind, if any, moved to the front.
[[nodiscard]] auto connection_order(const peer &record) -> std::vector<transport_endpoint>;

[[nodiscard]] auto active_endpoint(const peer &record) -> std::optional<transport_endpoint>;

/**
 * @brief Checks the status/active-flag invariant.
 *
 * Holds when at most one endpoint is active, and for peers with endpoints, status is connected
 * exactly when one endpoint is active.
 */
[[nodiscard]] auto status_consistent(const peer &record) -> bool;

/**
 * @brief Display name for a freshly paired peer.
 *
 * "wss://my-box.local:3001" becomes "My-box Agent"; "Unknown Agent" when no host can be read.
 */
[[nodiscard]] auto default_peer_name(std::string_view url) -> std::string;

/// Lowercases the scheme and host and drops trailing slashes, for URL de-duplication.
[[nodiscard]] auto normalize_url(std::string_view url) -> std::string;

auto to_json(nlohmann::json &json, const transport_endpoint &endpoint) -> void;
auto from_json(const nlohmann::json &json, transport_endpoint &endpoint) -> void;
auto to_json(nlohmann::json &json, const peer &record) -> void;
auto from_json(const nlohmann::json &json, peer &record) -> void;

}// namespace tether::core
