#include <catch2/catch_test_macros.hpp>

#include <pairing/errors.hpp>
#include <pairing/pairing_url.hpp>

#include <string_view>
#include <tuple>

using tether::core::transport_kind;
using tether::pairing::error_kind;
using tether::pairing::pairing_error;
using tether::pairing::pairing_kind;
using tether::pairing::parse_pairing_url;

namespace {
auto error_of(std::string_view url) -> error_kind
{
  try {
    std::ignore = parse_pairing_url(url);
  } catch (const pairing_error &error) {
    return error.kind();
  }
  FAIL("expected a pairing_error for " << url);
  return error_kind::invalid_url;
}
}// namespace

SCENARIO("Pairing URLs are parsed into descriptors", "[pairing][url]")
{
  GIVEN("A direct pairing URL with a fingerprint")
  {
    const auto descriptor = parse_pairing_url("https://10.0.0.5:3001/pair/direct?code=482913&fp=SHA256:11:22:33");

    THEN("every part is extracted")
    {
      CHECK(descriptor.kind == pairing_kind::direct);
      CHECK(descriptor.kind_name == "direct");
      CHECK(descriptor.code == "482913");
      CHECK(descriptor.fingerprint == "SHA256:11:22:33");
      CHECK(descriptor.base_url == "https://10.0.0.5:3001");
      CHECK(descriptor.full_url == "https://10.0.0.5:3001/pair/direct?code=482913&fp=SHA256:11:22:33");
      CHECK(descriptor.websocket_url() == "wss://10.0.0.5:3001");
      CHECK(descriptor.transport() == transport_kind::direct_pinned);
      CHECK(descriptor.description() == "Local Network");
    }
  }

  GIVEN("Alias kind names")
  {
    THEN("they map onto the same families")
    {
      CHECK(parse_pairing_url("https://box:3001/pair/local?code=1&fp=AA").kind == pairing_kind::direct);
      CHECK(parse_pairing_url("https://x.example.dev/pair/cloudflare?code=1").kind == pairing_kind::relay);
      CHECK(parse_pairing_url("https://box.ts.net/pair/tailscale?code=1").kind == pairing_kind::mesh);
    }
  }

  GIVEN("A mesh URL")
  {
    THEN("the fingerprint decides between pinned and trusted")
    {
      CHECK(parse_pairing_url("https://box.ts.net/pair/mesh?code=1").transport() == transport_kind::mesh_trusted);
      CHECK(parse_pairing_url("https://100.64.0.2:3001/pair/mesh?code=1&fp=AA:BB").transport()
            == transport_kind::mesh_pinned);
    }
  }

  GIVEN("An unknown kind")
  {
    const auto descriptor = parse_pairing_url("https://box/pair/carrier-pigeon?code=9");

    THEN("it parses but has no transport")
    {
      CHECK(descriptor.kind == pairing_kind::unsupported);
      CHECK(descriptor.kind_name == "carrier-pigeon");
      CHECK_FALSE(descriptor.transport().has_value());
    }
  }

  GIVEN("Encoded values, whitespace and repeated keys")
  {
    const auto descriptor = parse_pairing_url("  https://box:3001/pair/direct?code=48%2029&fp=SHA256%3AAB&code=other  ");

    THEN("values are decoded and the first occurrence wins")
    {
      CHECK(descriptor.code == "48 29");
      CHECK(descriptor.fingerprint == "SHA256:AB");
    }
  }

  GIVEN("An empty fp parameter")
  {
    THEN("no fingerprint is recorded")
    {
      CHECK_FALSE(parse_pairing_url("https://box/pair/mesh?code=1&fp=").fingerprint.has_value());
    }
  }
}

TEST_CASE("Malformed pairing URLs are rejected with a specific error", "[pairing][url]")
{
  CHECK(error_of("") == error_kind::invalid_url);
  CHECK(error_of("not a url") == error_kind::invalid_url);
  CHECK(error_of("ftp://box/pair/direct?code=1") == error_kind::invalid_url);
  CHECK(error_of("https:///pair/direct?code=1") == error_kind::invalid_url);
  CHECK(error_of("https://box:abc/pair/direct?code=1") == error_kind::invalid_url);
  CHECK(error_of("https://box/connect?code=1") == error_kind::invalid_url);
  CHECK(error_of("https://box/pair/?code=1") == error_kind::invalid_url);
  CHECK(error_of("https://box/pair/direct") == error_kind::missing_code);
  CHECK(error_of("https://box/pair/direct?code=") == error_kind::missing_code);
}

TEST_CASE("to_url rebuilds an equivalent pairing URL", "[pairing][url]")
{
  const auto original = parse_pairing_url("https://box:3001/pair/direct?code=48%2029&fp=SHA256:AB:CD");
  const auto rebuilt = parse_pairing_url(original.to_url());

  CHECK(rebuilt.code == original.code);
  CHECK(rebuilt.fingerprint == original.fingerprint);
  CHECK(rebuilt.base_url == original.base_url);
  CHECK(rebuilt.kind == original.kind);
}
