#include <platform/env_utils.hpp>

#include <cstdlib>
#include <mutex>

namespace tether::platform {

namespace {
  auto read_env(const char *name) -> std::string
  {
    static std::mutex env_mutex;
    const std::scoped_lock lock(env_mutex);

    const auto *value = std::getenv(name);// NOLINT(concurrency-mt-unsafe)
    return value != nullptr ? std::string(value) : std::string{};
  }
}// namespace

auto get_home_directory() -> std::string { return read_env("HOME"); }

auto get_temp_directory() -> std::string
{
  auto temp = read_env("TMPDIR");
  if (not temp.empty()) { return temp; }
  return "/tmp";
}

auto expand_tilde_path(const std::string &path) -> std::string
{
  if (path != "~" and not path.starts_with("~/")) { return path; }

  auto home = get_home_directory();
  if (home.empty()) { return path; }

  return home + path.substr(1);
}

auto current_working_directory() -> std::string
{
  std::error_code error;
  auto cwd = std::filesystem::current_path(error);
  if (error) { return get_home_directory(); }
  return cwd.string();
}

auto ensure_private_directory(const std::filesystem::path &directory) -> void
{
  if (std::filesystem::exists(directory)) { return; }

  std::filesystem::create_directories(directory);
  std::filesystem::permissions(directory, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace);
}

}// namespace tether::platform
