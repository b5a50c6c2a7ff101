#pragma once

#include <core/credentials.hpp>
#include <core/transport_kind.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace tether::pairing {

/**
 * @brief Decodes a 200 pairing response body into credentials.
 *
 * Every kind requires `url` and `authToken`; the relay gateway additionally requires `clientId`
 * and `clientSecret`. `protocol` and `version` default to "acp" and "1.0.0".
 *
 * @throws pairing_error invalid_response on malformed JSON, missing fields or unusable credentials
 */
[[nodiscard]] auto decode_pairing_response(core::transport_kind kind, std::string_view body)
  -> core::connection_credentials;

/**
 * @brief The `message` field of a JSON error body, if there is one.
 */
[[nodiscard]] auto extract_server_message(std::string_view body) -> std::optional<std::string>;

}// namespace tether::pairing
