#pragma once

#include <core/transport_kind.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tether::pairing {

/// Transport family named by the `/pair/<kind>` path segment.
enum class pairing_kind : std::uint8_t {
  direct,///< "direct" or "local"
  relay,///< "relay" or "cloudflare"
  mesh,///< "mesh" or "tailscale"
  unsupported,///< Anything else, kept so the caller can name it
};

/**
 * @brief A parsed pairing URL. Used for exactly one exchange and never stored.
 */
struct pairing_descriptor
{
  pairing_kind kind{ pairing_kind::unsupported };
  std::string kind_name;///< Raw `<kind>` segment as it appeared
  std::string code;///< One-time code, non-empty
  std::optional<std::string> fingerprint;///< Expected certificate fingerprint (`fp`)
  std::string full_url;///< URL to GET
  std::string base_url;///< scheme://host[:port]

  /**
   * @brief Transport kind the resulting credentials belong to.
   *
   * A mesh descriptor is pinned when it carries a fingerprint. Empty for unsupported kinds.
   */
  [[nodiscard]] auto transport() const -> std::optional<core::transport_kind>;

  /// Base URL with https→wss and http→ws.
  [[nodiscard]] auto websocket_url() const -> std::string;

  /// Human-readable transport label.
  [[nodiscard]] auto description() const -> std::string;

  /// Rebuilds base + "/pair/<kind>" + query from the parsed parts.
  [[nodiscard]] auto to_url() const -> std::string;
};

/**
 * @brief Parses a scanned or typed pairing URL.
 *
 * Surrounding whitespace is ignored. Query values are percent-decoded; the first occurrence of a
 * repeated key wins.
 *
 * @throws pairing_error invalid_url for a malformed URL, a non-HTTP(S) scheme or a path outside
 *         /pair/; missing_code when `code` is absent or empty
 */
[[nodiscard]] auto parse_pairing_url(std::string_view input) -> pairing_descriptor;

}// namespace tether::pairing
