#pragma once

#include <string>

namespace tether::core {

/**
 * @brief Local identifier for a newly paired peer.
 *
 * @return RFC 4122 UUID in canonical form
 */
[[nodiscard]] auto new_peer_id() -> std::string;

/**
 * @brief Identifier for a transport endpoint; also the credential store key for its secrets.
 */
[[nodiscard]] auto new_endpoint_id() -> std::string;

}// namespace tether::core
