#pragma once

#include <core/credentials.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace tether::registry {

/**
 * @brief Credential store backed by a JSON file readable only by the owner.
 *
 * Without a path the store lives in memory only. Every save/remove rewrites the file.
 */
class file_credential_store
{
public:
  file_credential_store() = default;

  /**
   * @brief Loads existing credentials from `path` if the file exists.
   *
   * @throws std::runtime_error when the file exists but cannot be parsed
   */
  explicit file_credential_store(std::filesystem::path path);

  auto save(const std::string &key, const core::connection_credentials &credentials) -> void;
  [[nodiscard]] auto retrieve(const std::string &key) -> std::optional<core::connection_credentials>;
  auto remove(const std::string &key) -> void;

  [[nodiscard]] auto size() const -> std::size_t;

private:
  auto persist() const -> void;

  std::optional<std::filesystem::path> path_;
  mutable std::mutex mutex_;
  std::map<std::string, core::connection_credentials> entries_;
};

}// namespace tether::registry
