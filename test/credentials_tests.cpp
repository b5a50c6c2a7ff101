#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <core/credentials.hpp>

using tether::core::connection_credentials;
using tether::core::validation_error;

SCENARIO("Credentials are validated before use", "[core][credentials]")
{
  GIVEN("A pinned direct credential set")
  {
    connection_credentials credentials{ .url = "wss://10.0.0.5:3001",
      .auth_token = "token",
      .client_id = std::nullopt,
      .client_secret = std::nullopt,
      .cert_fingerprint = "SHA256:11:22:33" };

    THEN("it validates") { REQUIRE_NOTHROW(credentials.validate()); }
    THEN("it reports a pinned certificate") { REQUIRE(credentials.has_pinned_certificate()); }
  }

  GIVEN("An empty URL")
  {
    const connection_credentials credentials{};
    THEN("validation fails") { REQUIRE_THROWS_AS(credentials.validate(), validation_error); }
  }

  GIVEN("An unknown scheme")
  {
    const connection_credentials credentials{ .url = "ftp://agent.example" };
    THEN("validation fails") { REQUIRE_THROWS_AS(credentials.validate(), validation_error); }
  }

  GIVEN("A different protocol")
  {
    connection_credentials credentials{ .url = "wss://agent.example" };
    credentials.protocol = "mcp";
    THEN("validation fails") { REQUIRE_THROWS_AS(credentials.validate(), validation_error); }
  }

  GIVEN("An https gateway URL")
  {
    connection_credentials credentials{ .url = "https://agent.example.dev" };

    THEN("it needs both gateway secrets")
    {
      REQUIRE_THROWS_AS(credentials.validate(), validation_error);
      credentials.client_id = "id.access";
      REQUIRE_THROWS_AS(credentials.validate(), validation_error);
      credentials.client_secret = "secret";
      REQUIRE_NOTHROW(credentials.validate());
    }
  }

  GIVEN("An empty fingerprint string")
  {
    const connection_credentials credentials{ .url = "wss://a", .cert_fingerprint = "" };
    THEN("it is not treated as pinned") { REQUIRE_FALSE(credentials.has_pinned_certificate()); }
  }
}

TEST_CASE("websocket_url maps http schemes onto websocket schemes", "[core][credentials]")
{
  CHECK(connection_credentials{ .url = "https://agent.example.dev/acp" }.websocket_url() == "wss://agent.example.dev/acp");
  CHECK(connection_credentials{ .url = "http://10.0.0.5:3000" }.websocket_url() == "ws://10.0.0.5:3000");
  CHECK(connection_credentials{ .url = "wss://10.0.0.5:3001" }.websocket_url() == "wss://10.0.0.5:3001");
}

TEST_CASE("credentials_for_endpoint takes the endpoint URL and the best secrets", "[core][credentials]")
{
  const connection_credentials legacy{ .url = "wss://old", .auth_token = "legacy-token" };
  const connection_credentials own{ .url = "wss://stale", .auth_token = "own-token" };

  SECTION("endpoint secrets win")
  {
    const auto result = tether::core::credentials_for_endpoint("wss://mesh:3001", own, legacy);
    CHECK(result.url == "wss://mesh:3001");
    CHECK(result.auth_token == "own-token");
  }

  SECTION("legacy secrets are the fallback")
  {
    const auto result = tether::core::credentials_for_endpoint("wss://mesh:3001", std::nullopt, legacy);
    CHECK(result.url == "wss://mesh:3001");
    CHECK(result.auth_token == "legacy-token");
  }

  SECTION("with nothing stored only the URL is set")
  {
    const auto result = tether::core::credentials_for_endpoint("wss://mesh:3001", std::nullopt, std::nullopt);
    CHECK(result.url == "wss://mesh:3001");
    CHECK_FALSE(result.auth_token.has_value());
  }
}

TEST_CASE("credentials serialize with camelCase keys and omit unset secrets", "[core][credentials][json]")
{
  const connection_credentials credentials{ .url = "https://agent.example.dev",
    .auth_token = std::nullopt,
    .client_id = "id.access",
    .client_secret = "secret" };

  const nlohmann::json json = credentials;

  CHECK(json.at("clientId") == "id.access");
  CHECK(json.at("clientSecret") == "secret");
  CHECK(json.at("protocol") == "acp");
  CHECK_FALSE(json.contains("authToken"));
  CHECK_FALSE(json.contains("certFingerprint"));
  CHECK(json.get<connection_credentials>() == credentials);
}
