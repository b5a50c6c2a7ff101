#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tether::session {

enum class errc : std::uint8_t {
  no_active_session,
  unknown_tool_call,
};

/**
 * @brief Local precondition failure; raised synchronously and never retried.
 */
class session_error : public std::runtime_error
{
public:
  session_error(errc code, const std::string &message) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] auto code() const -> errc { return code_; }

  [[nodiscard]] static auto no_active_session() -> session_error
  {
    return { errc::no_active_session, "No active session" };
  }

  [[nodiscard]] static auto unknown_tool_call(const std::string &tool_call_id) -> session_error
  {
    return { errc::unknown_tool_call, "No pending permission request for tool call: " + tool_call_id };
  }

private:
  errc code_;
};

}// namespace tether::session
