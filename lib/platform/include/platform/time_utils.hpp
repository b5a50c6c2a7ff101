#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tether::platform {

/**
 * @brief Formats the current local time as HH:MM:SS.
 */
[[nodiscard]] auto format_current_time_hms() -> std::string;

/**
 * @brief Formats a point in time as local "YYYY-MM-DD HH:MM".
 */
[[nodiscard]] auto format_local_datetime(std::chrono::system_clock::time_point when) -> std::string;

[[nodiscard]] auto to_unix_seconds(std::chrono::system_clock::time_point when) -> std::int64_t;

[[nodiscard]] auto from_unix_seconds(std::int64_t seconds) -> std::chrono::system_clock::time_point;

}// namespace tether::platform
