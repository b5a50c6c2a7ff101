#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tether::acp {

/// What the agent reported about itself during initialize.
struct agent_info
{
  std::string name;
  std::string version;
  int protocol_version{ 1 };
  bool supports_load_session{ false };
};

/// Incremental answer text.
struct message_chunk
{
  std::string text;
};

/// Incremental reasoning text.
struct thought_chunk
{
  std::string text;
};

/// A tool invocation started.
struct tool_call
{
  std::string id;
  std::string title;
  std::string kind;
  std::string status;
};

/// Progress or output for an earlier tool_call, keyed by the same id.
struct tool_call_update
{
  std::string id;
  std::optional<std::string> status;
  std::optional<std::string> title;
  std::string output;
};

using session_update = std::variant<message_chunk, thought_chunk, tool_call, tool_call_update>;

struct permission_option
{
  std::string option_id;
  std::string name;
  std::string kind;///< allow_once, allow_always, reject_once, reject_always

  auto operator==(const permission_option &) const -> bool = default;
};

/**
 * @brief The agent asks before running a sensitive tool call.
 */
struct permission_request
{
  std::string session_id;
  std::string tool_call_id;
  std::string title;
  std::optional<std::string> command;
  std::vector<permission_option> options;
};

/// The user's answer: a chosen option, or cancelled when no option was chosen.
struct permission_outcome
{
  std::optional<std::string> option_id;

  [[nodiscard]] static auto selected(std::string option) -> permission_outcome { return { std::move(option) }; }
  [[nodiscard]] static auto cancelled() -> permission_outcome { return {}; }
  [[nodiscard]] auto is_cancelled() const -> bool { return not option_id.has_value(); }
};

/**
 * @brief Error object returned by the agent for one of our requests.
 */
class rpc_error : public std::runtime_error
{
public:
  rpc_error(int code, const std::string &message) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] auto code() const -> int { return code_; }

private:
  int code_;
};

}// namespace tether::acp
