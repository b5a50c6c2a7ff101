#pragma once

#include <core/credentials.hpp>

#include <concepts>
#include <optional>
#include <string>

namespace tether::concepts {

/**
 * @brief Secret storage keyed by peer id (legacy credentials) or endpoint id.
 */
template<typename T>
concept credential_store =
  requires(T &store, const std::string &key, const core::connection_credentials &credentials) {
    { store.save(key, credentials) } -> std::same_as<void>;
    { store.retrieve(key) } -> std::same_as<std::optional<core::connection_credentials>>;
    { store.remove(key) } -> std::same_as<void>;
  };

}// namespace tether::concepts
