#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tether::session {

namespace state {
  struct disconnected
  {
    auto operator==(const disconnected &) const -> bool = default;
  };

  struct connecting
  {
    auto operator==(const connecting &) const -> bool = default;
  };

  struct connected
  {
    auto operator==(const connected &) const -> bool = default;
  };

  struct error
  {
    std::string message;

    auto operator==(const error &) const -> bool = default;
  };
}// namespace state

using connection_state = std::variant<state::disconnected, state::connecting, state::connected, state::error>;

[[nodiscard]] inline auto to_string(const connection_state &current) -> std::string
{
  if (std::holds_alternative<state::connecting>(current)) { return "connecting"; }
  if (std::holds_alternative<state::connected>(current)) { return "connected"; }
  if (const auto *failed = std::get_if<state::error>(&current)) { return "error: " + failed->message; }
  return "disconnected";
}

/**
 * @brief What happened to the session id passed to connect().
 *
 * `failed` means the agent refused to load the session and a new one was created in its place;
 * callers can tell that apart from a session that was never resumed.
 */
enum class resume_outcome : std::uint8_t {
  not_attempted,
  resumed,
  failed,
};

[[nodiscard]] inline auto to_string(resume_outcome outcome) -> std::string_view
{
  switch (outcome) {
  case resume_outcome::resumed:
    return "resumed";
  case resume_outcome::failed:
    return "failed";
  case resume_outcome::not_attempted:
    break;
  }
  return "not_attempted";
}

/**
 * @brief Retry and timeout knobs for one connect() call.
 */
struct connection_profile
{
  static constexpr int default_max_retries = 3;
  static constexpr int pairing_max_retries = 2;
  static constexpr auto default_attempt_timeout = std::chrono::seconds(300);
  static constexpr auto default_retry_backoff = std::chrono::milliseconds(2000);

  int max_retries{ default_max_retries };
  std::chrono::milliseconds attempt_timeout{ default_attempt_timeout };///< Transport handshake and each request
  std::chrono::milliseconds retry_backoff{ default_retry_backoff };
  std::optional<std::chrono::milliseconds> permission_timeout;///< Unset: wait for the user indefinitely

  /// Test connection right after pairing; the bridge may wait for a human to approve access.
  [[nodiscard]] static auto pairing() -> connection_profile
  {
    return connection_profile{ .max_retries = pairing_max_retries,
      .attempt_timeout = default_attempt_timeout,
      .retry_backoff = default_retry_backoff,
      .permission_timeout = std::nullopt };
  }
};

}// namespace tether::session
