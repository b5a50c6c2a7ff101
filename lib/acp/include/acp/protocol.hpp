#pragma once

#include <acp/types.hpp>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace tether::acp::protocol {

inline constexpr int protocol_version = 1;

/// JSON-RPC error code for requests we do not serve (file system, terminal).
inline constexpr int method_not_found = -32601;
inline constexpr int invalid_params = -32602;

namespace method {
  inline constexpr std::string_view initialize = "initialize";
  inline constexpr std::string_view session_new = "session/new";
  inline constexpr std::string_view session_load = "session/load";
  inline constexpr std::string_view session_prompt = "session/prompt";
  inline constexpr std::string_view session_update = "session/update";
  inline constexpr std::string_view session_request_permission = "session/request_permission";
  inline constexpr std::string_view session_cancel = "session/cancel";
}// namespace method

enum class message_kind : std::uint8_t { response, request, notification, invalid };

/**
 * @brief Tells responses to our requests apart from the agent's requests and notifications.
 */
[[nodiscard]] auto classify(const nlohmann::json &message) -> message_kind;

[[nodiscard]] auto make_request(std::int64_t id, std::string_view method, nlohmann::json params) -> std::string;
[[nodiscard]] auto make_notification(std::string_view method, nlohmann::json params) -> std::string;
[[nodiscard]] auto make_result(const nlohmann::json &id, nlohmann::json result) -> std::string;
[[nodiscard]] auto make_error(const nlohmann::json &id, int code, std::string_view message) -> std::string;

[[nodiscard]] auto initialize_params() -> nlohmann::json;
[[nodiscard]] auto new_session_params(std::string_view working_directory) -> nlohmann::json;
[[nodiscard]] auto load_session_params(std::string_view session_id, std::string_view working_directory)
  -> nlohmann::json;
[[nodiscard]] auto prompt_params(std::string_view session_id, std::string_view text) -> nlohmann::json;

/**
 * @brief Reads the initialize result.
 *
 * The name comes from `agentInfo.title`, then `agentInfo.name`, then "Agent".
 */
[[nodiscard]] auto parse_agent_info(const nlohmann::json &result) -> agent_info;

/// @throws std::runtime_error when `sessionId` is missing
[[nodiscard]] auto parse_session_id(const nlohmann::json &result) -> std::string;

/// `stopReason` of a prompt result, "end_turn" when absent.
[[nodiscard]] auto parse_stop_reason(const nlohmann::json &result) -> std::string;

/**
 * @brief Decodes the `update` of a session/update notification.
 *
 * @return std::nullopt for update types this client does not render (plans, mode changes, ...)
 */
[[nodiscard]] auto parse_session_update(const nlohmann::json &params) -> std::optional<session_update>;

/// @throws nlohmann::json::exception when required fields are missing
[[nodiscard]] auto parse_permission_request(const nlohmann::json &params) -> permission_request;

/// Result body answering a session/request_permission request.
[[nodiscard]] auto permission_response(const permission_outcome &outcome) -> nlohmann::json;

}// namespace tether::acp::protocol
