#include <acp/protocol.hpp>

#include <stdexcept>

namespace tether::acp::protocol {

namespace {
  auto string_or(const nlohmann::json &object, const char *key, std::string fallback) -> std::string
  {
    if (object.is_object() and object.contains(key) and object.at(key).is_string()) {
      return object.at(key).get<std::string>();
    }
    return fallback;
  }

  auto optional_string(const nlohmann::json &object, const char *key) -> std::optional<std::string>
  {
    if (object.is_object() and object.contains(key) and object.at(key).is_string()) {
      return object.at(key).get<std::string>();
    }
    return std::nullopt;
  }

  auto content_text(const nlohmann::json &content) -> std::string
  {
    if (content.is_object() and string_or(content, "type", "") == "text") { return string_or(content, "text", ""); }
    return {};
  }

  // tool_call_update content is a list of {"type": "content", "content": {...}} blocks.
  auto tool_output(const nlohmann::json &update) -> std::string
  {
    if (not update.contains("content") or not update.at("content").is_array()) { return {}; }

    std::string output;
    for (const auto &block : update.at("content")) {
      if (string_or(block, "type", "") != "content" or not block.contains("content")) { continue; }
      auto text = content_text(block.at("content"));
      if (text.empty()) { continue; }
      if (not output.empty()) { output += '\n'; }
      output += text;
    }
    return output;
  }
}// namespace

auto classify(const nlohmann::json &message) -> message_kind
{
  if (not message.is_object()) { return message_kind::invalid; }

  const bool has_id = message.contains("id") and not message.at("id").is_null();
  const bool has_method = message.contains("method") and message.at("method").is_string();

  if (has_method) { return has_id ? message_kind::request : message_kind::notification; }
  if (has_id and (message.contains("result") or message.contains("error"))) { return message_kind::response; }
  return message_kind::invalid;
}

auto make_request(std::int64_t id, std::string_view method, nlohmann::json params) -> std::string
{
  return nlohmann::json{ { "jsonrpc", "2.0" }, { "id", id }, { "method", std::string(method) }, { "params", std::move(params) } }
    .dump();
}

auto make_notification(std::string_view method, nlohmann::json params) -> std::string
{
  return nlohmann::json{ { "jsonrpc", "2.0" }, { "method", std::string(method) }, { "params", std::move(params) } }.dump();
}

auto make_result(const nlohmann::json &id, nlohmann::json result) -> std::string
{
  return nlohmann::json{ { "jsonrpc", "2.0" }, { "id", id }, { "result", std::move(result) } }.dump();
}

auto make_error(const nlohmann::json &id, int code, std::string_view message) -> std::string
{
  return nlohmann::json{ { "jsonrpc", "2.0" },
    { "id", id },
    { "error", { { "code", code }, { "message", std::string(message) } } } }
    .dump();
}

auto initialize_params() -> nlohmann::json
{
  return { { "protocolVersion", protocol_version },
    { "clientCapabilities",
      { { "fs", { { "readTextFile", false }, { "writeTextFile", false } } }, { "terminal", false } } } };
}

auto new_session_params(std::string_view working_directory) -> nlohmann::json
{
  return { { "cwd", std::string(working_directory) }, { "mcpServers", nlohmann::json::array() } };
}

auto load_session_params(std::string_view session_id, std::string_view working_directory) -> nlohmann::json
{
  return { { "sessionId", std::string(session_id) }, { "cwd", std::string(working_directory) }, { "mcpServers", nlohmann::json::array() } };
}

auto prompt_params(std::string_view session_id, std::string_view text) -> nlohmann::json
{
  return { { "sessionId", std::string(session_id) },
    { "prompt", nlohmann::json::array({ { { "type", "text" }, { "text", std::string(text) } } }) } };
}

auto parse_agent_info(const nlohmann::json &result) -> agent_info
{
  agent_info info;
  info.protocol_version = result.value("protocolVersion", protocol_version);

  if (result.contains("agentInfo") and result.at("agentInfo").is_object()) {
    const auto &details = result.at("agentInfo");
    info.name = string_or(details, "title", string_or(details, "name", "Agent"));
    info.version = string_or(details, "version", "");
  } else {
    info.name = "Agent";
  }

  if (result.contains("agentCapabilities") and result.at("agentCapabilities").is_object()) {
    info.supports_load_session = result.at("agentCapabilities").value("loadSession", false);
  }
  return info;
}

auto parse_session_id(const nlohmann::json &result) -> std::string
{
  auto session_id = optional_string(result, "sessionId");
  if (not session_id or session_id->empty()) { throw std::runtime_error("session/new result has no sessionId"); }
  return *session_id;
}

auto parse_stop_reason(const nlohmann::json &result) -> std::string { return string_or(result, "stopReason", "end_turn"); }

auto parse_session_update(const nlohmann::json &params) -> std::optional<session_update>
{
  if (not params.is_object() or not params.contains("update")) { return std::nullopt; }
  const auto &update = params.at("update");
  const auto type = string_or(update, "sessionUpdate", "");

  if (type == "agent_message_chunk") {
    return message_chunk{ .text = content_text(update.value("content", nlohmann::json::object())) };
  }
  if (type == "agent_thought_chunk") {
    return thought_chunk{ .text = content_text(update.value("content", nlohmann::json::object())) };
  }
  if (type == "tool_call") {
    return tool_call{ .id = string_or(update, "toolCallId", ""),
      .title = string_or(update, "title", ""),
      .kind = string_or(update, "kind", "other"),
      .status = string_or(update, "status", "pending") };
  }
  if (type == "tool_call_update") {
    return tool_call_update{ .id = string_or(update, "toolCallId", ""),
      .status = optional_string(update, "status"),
      .title = optional_string(update, "title"),
      .output = tool_output(update) };
  }
  return std::nullopt;
}

auto parse_permission_request(const nlohmann::json &params) -> permission_request
{
  const auto &call = params.at("toolCall");

  permission_request request;
  request.session_id = string_or(params, "sessionId", "");
  request.tool_call_id = call.at("toolCallId").get<std::string>();
  request.title = string_or(call, "title", "Permission required");
  if (call.contains("rawInput")) { request.command = optional_string(call.at("rawInput"), "command"); }

  for (const auto &option : params.at("options")) {
    request.options.push_back(permission_option{ .option_id = option.at("optionId").get<std::string>(),
      .name = string_or(option, "name", ""),
      .kind = string_or(option, "kind", "") });
  }
  return request;
}

auto permission_response(const permission_outcome &outcome) -> nlohmann::json
{
  if (outcome.is_cancelled()) { return { { "outcome", { { "outcome", "cancelled" } } } }; }
  return { { "outcome", { { "outcome", "selected" }, { "optionId", *outcome.option_id } } } };
}

}// namespace tether::acp::protocol
