#pragma once

#include <string>
#include <string_view>

namespace tether::transport {

/**
 * @brief Pieces of an absolute URL needed to open a connection.
 */
struct endpoint_url
{
  std::string scheme;///< Lowercased: ws, wss, http or https
  std::string host;///< Without IPv6 brackets
  std::string port;///< Explicit port or the scheme default
  std::string target;///< Path plus query, "/" when empty

  [[nodiscard]] auto is_secure() const -> bool { return scheme == "wss" or scheme == "https"; }
};

/**
 * @brief Splits an absolute ws/wss/http/https URL.
 *
 * @throws std::invalid_argument on a missing scheme, unsupported scheme, empty host or bad port
 */
[[nodiscard]] auto parse_endpoint_url(std::string_view url) -> endpoint_url;

}// namespace tether::transport
