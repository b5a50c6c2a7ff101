#pragma once

#include <concepts/credential_store.hpp>
#include <core/credentials.hpp>

#include <map>
#include <optional>
#include <string>

namespace tether::test {

class test_double_credential_store
{
public:
  auto save(const std::string &key, const core::connection_credentials &credentials) -> void
  {
    entries_[key] = credentials;
  }

  auto retrieve(const std::string &key) -> std::optional<core::connection_credentials>
  {
    auto found = entries_.find(key);
    if (found == entries_.end()) { return std::nullopt; }
    return found->second;
  }

  auto remove(const std::string &key) -> void { entries_.erase(key); }

  [[nodiscard]] auto contains(const std::string &key) const -> bool { return entries_.contains(key); }
  [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }

private:
  std::map<std::string, core::connection_credentials> entries_;
};

static_assert(tether::concepts::credential_store<test_double_credential_store>);

}// namespace tether::test
