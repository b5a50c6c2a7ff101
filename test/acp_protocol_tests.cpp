#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <acp/protocol.hpp>

#include <variant>

using namespace tether::acp;
using nlohmann::json;

TEST_CASE("messages are classified by id and method", "[acp][protocol]")
{
  CHECK(protocol::classify(json::parse(R"({"jsonrpc":"2.0","id":1,"result":{}})")) == protocol::message_kind::response);
  CHECK(protocol::classify(json::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":1,"message":"x"}})"))
        == protocol::message_kind::response);
  CHECK(protocol::classify(json::parse(R"({"jsonrpc":"2.0","id":"a","method":"session/request_permission"})"))
        == protocol::message_kind::request);
  CHECK(protocol::classify(json::parse(R"({"jsonrpc":"2.0","method":"session/update","params":{}})"))
        == protocol::message_kind::notification);
  CHECK(protocol::classify(json::parse(R"({"jsonrpc":"2.0","id":null,"method":"session/update"})"))
        == protocol::message_kind::notification);
  CHECK(protocol::classify(json::parse(R"({"jsonrpc":"2.0","id":3})")) == protocol::message_kind::invalid);
  CHECK(protocol::classify(json::parse(R"([1,2])")) == protocol::message_kind::invalid);
}

TEST_CASE("requests carry the JSON-RPC envelope", "[acp][protocol]")
{
  const auto request = json::parse(protocol::make_request(7, protocol::method::session_new, protocol::new_session_params("/work")));
  CHECK(request.at("jsonrpc") == "2.0");
  CHECK(request.at("id") == 7);
  CHECK(request.at("method") == "session/new");
  CHECK(request.at("params").at("cwd") == "/work");
  CHECK(request.at("params").at("mcpServers").empty());

  const auto error = json::parse(protocol::make_error("abc", protocol::method_not_found, "Method not found: fs/read"));
  CHECK(error.at("id") == "abc");
  CHECK(error.at("error").at("code") == -32601);
}

TEST_CASE("initialize advertises no client file system or terminal", "[acp][protocol]")
{
  const auto params = protocol::initialize_params();
  CHECK(params.at("protocolVersion") == 1);
  CHECK(params.at("clientCapabilities").at("fs").at("readTextFile") == false);
  CHECK(params.at("clientCapabilities").at("terminal") == false);
}

TEST_CASE("prompt and load params name the session", "[acp][protocol]")
{
  const auto prompt = protocol::prompt_params("s-1", "hello");
  CHECK(prompt.at("sessionId") == "s-1");
  CHECK(prompt.at("prompt").at(0).at("type") == "text");
  CHECK(prompt.at("prompt").at(0).at("text") == "hello");

  const auto load = protocol::load_session_params("s-1", "/work");
  CHECK(load.at("sessionId") == "s-1");
  CHECK(load.at("cwd") == "/work");
}

TEST_CASE("agent info is read from the initialize result", "[acp][protocol]")
{
  SECTION("full result")
  {
    const auto info = protocol::parse_agent_info(json::parse(
      R"({"protocolVersion":1,"agentInfo":{"name":"claude-code","title":"Claude Code","version":"2.1"},"agentCapabilities":{"loadSession":true}})"));
    CHECK(info.name == "Claude Code");
    CHECK(info.version == "2.1");
    CHECK(info.supports_load_session);
  }

  SECTION("minimal result")
  {
    const auto info = protocol::parse_agent_info(json::object());
    CHECK(info.name == "Agent");
    CHECK_FALSE(info.supports_load_session);
  }
}

TEST_CASE("session ids and stop reasons are extracted", "[acp][protocol]")
{
  CHECK(protocol::parse_session_id(json::parse(R"({"sessionId":"sess_1"})")) == "sess_1");
  CHECK_THROWS_AS(protocol::parse_session_id(json::object()), std::runtime_error);
  CHECK(protocol::parse_stop_reason(json::parse(R"({"stopReason":"cancelled"})")) == "cancelled");
  CHECK(protocol::parse_stop_reason(json::object()) == "end_turn");
}

TEST_CASE("session updates become typed updates", "[acp][protocol]")
{
  SECTION("message chunk")
  {
    const auto update = protocol::parse_session_update(json::parse(
      R"({"sessionId":"s","update":{"sessionUpdate":"agent_message_chunk","content":{"type":"text","text":"Hi"}}})"));
    REQUIRE(update.has_value());
    REQUIRE(std::get<message_chunk>(*update).text == "Hi");
  }

  SECTION("thought chunk")
  {
    const auto update = protocol::parse_session_update(json::parse(
      R"({"update":{"sessionUpdate":"agent_thought_chunk","content":{"type":"text","text":"hmm"}}})"));
    REQUIRE(std::get<thought_chunk>(update.value()).text == "hmm");
  }

  SECTION("tool call")
  {
    const auto update = protocol::parse_session_update(json::parse(
      R"({"update":{"sessionUpdate":"tool_call","toolCallId":"call_1","title":"Run ls","kind":"execute","status":"pending"}})"));
    const auto &call = std::get<tool_call>(update.value());
    CHECK(call.id == "call_1");
    CHECK(call.title == "Run ls");
    CHECK(call.kind == "execute");
  }

  SECTION("tool call update with output")
  {
    const auto update = protocol::parse_session_update(json::parse(
      R"({"update":{"sessionUpdate":"tool_call_update","toolCallId":"call_1","status":"completed","content":[{"type":"content","content":{"type":"text","text":"a.txt"}},{"type":"content","content":{"type":"text","text":"b.txt"}}]}})"));
    const auto &call_update = std::get<tool_call_update>(update.value());
    CHECK(call_update.id == "call_1");
    CHECK(call_update.status == "completed");
    CHECK_FALSE(call_update.title.has_value());
    CHECK(call_update.output == "a.txt\nb.txt");
  }

  SECTION("unknown kinds are ignored")
  {
    CHECK_FALSE(protocol::parse_session_update(json::parse(R"({"update":{"sessionUpdate":"plan"}})")).has_value());
    CHECK_FALSE(protocol::parse_session_update(json::object()).has_value());
  }
}

TEST_CASE("permission requests and answers", "[acp][protocol]")
{
  const auto request = protocol::parse_permission_request(json::parse(R"({
    "sessionId": "s-1",
    "toolCall": {"toolCallId": "call_9", "title": "Delete build dir", "rawInput": {"command": "rm -rf build"}},
    "options": [
      {"optionId": "allow_once", "name": "Allow", "kind": "allow_once"},
      {"optionId": "reject_once", "name": "Reject", "kind": "reject_once"}
    ]})"));

  CHECK(request.session_id == "s-1");
  CHECK(request.tool_call_id == "call_9");
  CHECK(request.title == "Delete build dir");
  CHECK(request.command == "rm -rf build");
  REQUIRE(request.options.size() == 2);
  CHECK(request.options[1] == permission_option{ .option_id = "reject_once", .name = "Reject", .kind = "reject_once" });

  CHECK_THROWS_AS(protocol::parse_permission_request(json::parse(R"({"toolCall":{}})")), json::exception);

  const auto selected = protocol::permission_response(permission_outcome::selected("allow_once"));
  CHECK(selected.at("outcome").at("outcome") == "selected");
  CHECK(selected.at("outcome").at("optionId") == "allow_once");

  const auto cancelled = protocol::permission_response(permission_outcome::cancelled());
  CHECK(cancelled.at("outcome").at("outcome") == "cancelled");
  CHECK_FALSE(cancelled.at("outcome").contains("optionId"));
}
