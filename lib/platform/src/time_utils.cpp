#include <platform/time_utils.hpp>

#include <ctime>
#include <fmt/format.h>
#include <tuple>

namespace tether::platform {

namespace {
  auto local_tm(std::chrono::system_clock::time_point when) -> std::tm
  {
    const std::time_t time_value = std::chrono::system_clock::to_time_t(when);
    std::tm time_tm{};
    std::ignore = localtime_r(&time_value, &time_tm);
    return time_tm;
  }
}// namespace

auto format_current_time_hms() -> std::string
{
  const auto time_tm = local_tm(std::chrono::system_clock::now());
  return fmt::format("{:02d}:{:02d}:{:02d}", time_tm.tm_hour, time_tm.tm_min, time_tm.tm_sec);
}

auto format_local_datetime(std::chrono::system_clock::time_point when) -> std::string
{
  static constexpr int tm_year_base = 1900;
  const auto time_tm = local_tm(when);
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}",
    time_tm.tm_year + tm_year_base,
    time_tm.tm_mon + 1,
    time_tm.tm_mday,
    time_tm.tm_hour,
    time_tm.tm_min);
}

auto to_unix_seconds(std::chrono::system_clock::time_point when) -> std::int64_t
{
  return std::chrono::duration_cast<std::chrono::seconds>(when.time_since_epoch()).count();
}

auto from_unix_seconds(std::int64_t seconds) -> std::chrono::system_clock::time_point
{
  return std::chrono::system_clock::time_point{ std::chrono::seconds{ seconds } };
}

}// namespace tether::platform
