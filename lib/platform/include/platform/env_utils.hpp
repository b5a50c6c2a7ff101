#pragma once

#include <filesystem>
#include <string>

namespace tether::platform {

/**
 * @brief Returns the user's home directory, or an empty string when unknown.
 */
[[nodiscard]] auto get_home_directory() -> std::string;

/**
 * @brief Returns the system temporary directory.
 */
[[nodiscard]] auto get_temp_directory() -> std::string;

/**
 * @brief Replaces a leading "~/" with the home directory.
 *
 * @param path Path possibly starting with ~/
 * @return Expanded path, or the input unchanged when there is nothing to expand
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

/// Working directory reported to agents when creating or resuming sessions.
[[nodiscard]] auto current_working_directory() -> std::string;

/**
 * @brief Creates the data directory if needed and restricts it to the owner.
 *
 * @throws std::filesystem::filesystem_error when the directory cannot be created
 */
auto ensure_private_directory(const std::filesystem::path &directory) -> void;

}// namespace tether::platform
