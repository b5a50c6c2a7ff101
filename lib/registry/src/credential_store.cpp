#include <registry/credential_store.hpp>

#include <concepts/credential_store.hpp>

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace tether::registry {

static_assert(concepts::credential_store<file_credential_store>);

file_credential_store::file_credential_store(std::filesystem::path path) : path_(std::move(path))
{
  if (not std::filesystem::exists(*path_)) { return; }

  std::ifstream input(*path_);
  auto document = nlohmann::json::parse(input, nullptr, false);
  if (document.is_discarded() or not document.is_object()) {
    throw std::runtime_error("Credential file is corrupt: " + path_->string());
  }

  try {
    for (const auto &[key, value] : document.items()) {
      entries_.emplace(key, value.get<core::connection_credentials>());
    }
  } catch (const nlohmann::json::exception &error) {
    throw std::runtime_error("Credential file is corrupt: " + path_->string() + ": " + error.what());
  }
  spdlog::debug("[credentials] Loaded {} entries", entries_.size());
}

auto file_credential_store::save(const std::string &key, const core::connection_credentials &credentials) -> void
{
  const std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = credentials;
  persist();
}

auto file_credential_store::retrieve(const std::string &key) -> std::optional<core::connection_credentials>
{
  const std::lock_guard<std::mutex> lock(mutex_);
  auto found = entries_.find(key);
  if (found == entries_.end()) { return std::nullopt; }
  return found->second;
}

auto file_credential_store::remove(const std::string &key) -> void
{
  const std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.erase(key) > 0) { persist(); }
}

auto file_credential_store::size() const -> std::size_t
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

auto file_credential_store::persist() const -> void
{
  if (not path_) { return; }

  nlohmann::json document = nlohmann::json::object();
  for (const auto &[key, credentials] : entries_) { document[key] = credentials; }

  auto staging = *path_;
  staging += ".tmp";
  {
    std::ofstream output(staging, std::ios::trunc);
    if (not output) { throw std::runtime_error("Cannot write " + staging.string()); }
    std::filesystem::permissions(staging,
      std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      std::filesystem::perm_options::replace);
    output << document.dump(2);
  }
  std::filesystem::rename(staging, *path_);
}

}// namespace tether::registry
