#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tether::core {

/**
 * @brief Closed set of ways a peer can be reached.
 */
enum class transport_kind : std::uint8_t {
  direct_pinned,///< Local network, self-signed certificate pinned by fingerprint
  relay_gateway,///< Public tunnel behind an access gateway (client id/secret), CA trust
  mesh_trusted,///< Mesh overlay with a CA-issued certificate
  mesh_pinned,///< Mesh overlay with a self-signed certificate pinned by fingerprint
};

/// Every kind, in default connection order.
inline constexpr std::array<transport_kind, 4> all_transport_kinds{
  transport_kind::mesh_trusted,
  transport_kind::mesh_pinned,
  transport_kind::relay_gateway,
  transport_kind::direct_pinned,
};

/// Canonical name, e.g. "direct-pinned".
[[nodiscard]] auto to_string(transport_kind kind) -> std::string_view;

/// Short human label, e.g. "Local Network".
[[nodiscard]] auto display_name(transport_kind kind) -> std::string_view;

/**
 * @brief Parses a canonical name.
 *
 * @return The kind, or std::nullopt for an unknown name
 */
[[nodiscard]] auto parse_transport_kind(std::string_view name) -> std::optional<transport_kind>;

/// Rank used for new endpoints of this kind; lower is tried first.
[[nodiscard]] auto default_priority(transport_kind kind) -> int;

/// True for kinds whose certificates are trusted by fingerprint rather than by CA.
[[nodiscard]] auto uses_pinning(transport_kind kind) -> bool;

}// namespace tether::core
