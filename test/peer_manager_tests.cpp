#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include <async/async_queue.hpp>
#include <core/events.hpp>
#include <registry/peer_manager.hpp>
#include <registry/peer_store.hpp>

#include "test_doubles/test_double_credential_store.hpp"
#include "test_doubles/test_double_protocol_connector.hpp"

using namespace std::chrono_literals;
using tether::core::connection_credentials;
using tether::core::connection_status;
using tether::core::transport_kind;
using tether::test::scripted_agent;
using tether::test::test_double_credential_store;
using tether::test::test_double_protocol_connector;
namespace events = tether::core::events;

namespace {
using manager_t =
  tether::registry::peer_manager<test_double_protocol_connector, test_double_credential_store, tether::registry::peer_store>;

auto plain_credentials(std::string url) -> connection_credentials
{
  return connection_credentials{ .url = std::move(url) };
}

auto quick_profile() -> tether::session::connection_profile
{
  return { .max_retries = 1, .attempt_timeout = 1s, .retry_backoff = 0ms, .permission_timeout = std::nullopt };
}

/// Two tries with a backoff long enough to act while an attempt waits between them.
auto patient_profile() -> tether::session::connection_profile
{
  return { .max_retries = 2, .attempt_timeout = 1s, .retry_backoff = 50ms, .permission_timeout = std::nullopt };
}

struct manager_fixture
{
  manager_fixture() : manager_fixture(quick_profile()) {}

  explicit manager_fixture(tether::session::connection_profile profile)
    : manager(std::make_shared<manager_t>(io_context,
      connector,
      credentials,
      peers,
      queue,
      tether::registry::peer_manager_config{ .sweep_interval = 1h, .profile = profile, .working_directory = "/work" }))
  {}

  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<scripted_agent> agent = std::make_shared<scripted_agent>();
  std::shared_ptr<test_double_protocol_connector> connector = std::make_shared<test_double_protocol_connector>(agent);
  std::shared_ptr<test_double_credential_store> credentials = std::make_shared<test_double_credential_store>();
  std::shared_ptr<tether::registry::peer_store> peers = std::make_shared<tether::registry::peer_store>();
  std::shared_ptr<manager_t::event_queue_t> queue = std::make_shared<manager_t::event_queue_t>(io_context);
  std::shared_ptr<manager_t> manager;

  template<typename T> auto get(boost::asio::awaitable<T> operation) -> T
  {
    io_context->restart();
    auto future = boost::asio::co_spawn(*io_context, std::move(operation), boost::asio::use_future);
    io_context->run();
    io_context->restart();
    return future.get();
  }

  auto drain() -> void
  {
    io_context->restart();
    io_context->run();
    io_context->restart();
  }

  auto published() -> std::vector<events::peer_event_t>
  {
    std::vector<events::peer_event_t> seen;
    while (auto event = queue->try_pop()) { seen.push_back(std::move(*event)); }
    return seen;
  }

  /// Peer with three endpoints: relay at priority 2, mesh at 0, direct at 1.
  auto add_three_endpoint_peer() -> void
  {
    manager->add_peer(plain_credentials("wss://legacy:3001"), "peer-1", "Box");
    peers->upsert_endpoint("peer-1", transport_kind::relay_gateway, "wss://a:3001", 2);
    peers->upsert_endpoint("peer-1", transport_kind::mesh_trusted, "wss://b:3001", 0);
    peers->upsert_endpoint("peer-1", transport_kind::direct_pinned, "wss://c:3001", 1);
  }

  auto peer() -> tether::core::peer { return peers->find("peer-1").value(); }
};

template<typename Event> auto count_of(const std::vector<events::peer_event_t> &seen) -> std::size_t
{
  std::size_t count = 0;
  for (const auto &event : seen) {
    if (std::holds_alternative<Event>(event)) { ++count; }
  }
  return count;
}
}// namespace

SCENARIO("Endpoints are tried in priority order until one connects", "[registry][peer_manager][fallback]")
{
  GIVEN("A peer whose lowest-priority endpoint is unreachable")
  {
    manager_fixture fixture;
    fixture.add_three_endpoint_peer();
    fixture.agent->unreachable_urls = { "wss://a:3001" };

    WHEN("a client is requested")
    {
      auto client = fixture.get(fixture.manager->get_connected_client("peer-1"));

      THEN("only the highest-priority endpoint was tried and it is the active one")
      {
        REQUIRE(client != nullptr);
        CHECK(fixture.agent->opened_urls == std::vector<std::string>{ "wss://b:3001" });
        CHECK(fixture.manager->active_transport("peer-1") == transport_kind::mesh_trusted);
        CHECK(fixture.peer().status == connection_status::connected);
        CHECK(fixture.peer().session_id == "session-1");
        CHECK(tether::core::status_consistent(fixture.peer()));
      }

      THEN("the attempt and the connection were announced")
      {
        const auto seen = fixture.published();
        CHECK(count_of<events::endpoint_attempt>(seen) == 1);
        CHECK(count_of<events::peer_connected>(seen) == 1);
        CHECK(count_of<events::peer_unreachable>(seen) == 0);
      }
    }
  }

  GIVEN("A peer whose best endpoint is unreachable")
  {
    manager_fixture fixture;
    fixture.add_three_endpoint_peer();
    fixture.agent->unreachable_urls = { "wss://b:3001" };

    WHEN("a client is requested")
    {
      auto client = fixture.get(fixture.manager->get_connected_client("peer-1"));

      THEN("the next endpoint takes over")
      {
        REQUIRE(client != nullptr);
        CHECK(fixture.agent->opened_urls == std::vector<std::string>{ "wss://b:3001", "wss://c:3001" });
        CHECK(fixture.manager->active_transport("peer-1") == transport_kind::direct_pinned);
        CHECK(tether::core::status_consistent(fixture.peer()));

        const auto seen = fixture.published();
        CHECK(count_of<events::endpoint_failed>(seen) == 1);
        CHECK(count_of<events::peer_connected>(seen) == 1);
      }
    }
  }

  GIVEN("A peer with no reachable endpoint")
  {
    manager_fixture fixture;
    fixture.add_three_endpoint_peer();
    fixture.agent->unreachable_urls = { "wss://a:3001", "wss://b:3001", "wss://c:3001" };

    WHEN("a client is requested")
    {
      auto client = fixture.get(fixture.manager->get_connected_client("peer-1"));

      THEN("nothing connects and the peer is unreachable")
      {
        CHECK(client == nullptr);
        CHECK(fixture.agent->opened_urls.size() == 3);
        CHECK(fixture.peer().status == connection_status::disconnected);
        CHECK_FALSE(fixture.manager->active_transport("peer-1").has_value());
        CHECK(tether::core::status_consistent(fixture.peer()));

        const auto seen = fixture.published();
        REQUIRE_FALSE(seen.empty());
        const auto *unreachable = std::get_if<events::peer_unreachable>(&seen.back());
        REQUIRE(unreachable != nullptr);
        CHECK(unreachable->error == "Failed after 1 attempts: Connection refused: wss://a:3001");
      }
    }
  }

  GIVEN("A peer with a preferred transport")
  {
    manager_fixture fixture;
    fixture.add_three_endpoint_peer();
    fixture.manager->set_preferred_transport("peer-1", transport_kind::relay_gateway);

    WHEN("a client is requested")
    {
      std::ignore = fixture.get(fixture.manager->get_connected_client("peer-1"));

      THEN("the preferred endpoint is tried first")
      {
        CHECK(fixture.agent->opened_urls == std::vector<std::string>{ "wss://a:3001" });
        CHECK(fixture.manager->active_transport("peer-1") == transport_kind::relay_gateway);
      }
    }
  }

  GIVEN("An endpoint with its own secrets and a peer with legacy ones")
  {
    manager_fixture fixture;
    fixture.manager->add_peer(
      connection_credentials{ .url = "wss://legacy:3001", .auth_token = "legacy-token" }, "peer-1", "Box");
    const auto direct = fixture.peers->upsert_endpoint("peer-1", transport_kind::direct_pinned, "wss://c:3001", 1);
    fixture.peers->upsert_endpoint("peer-1", transport_kind::mesh_trusted, "wss://b:3001", 0);
    fixture.credentials->save(direct.endpoint.id,
      connection_credentials{ .url = "wss://old:3001", .auth_token = "direct-token", .cert_fingerprint = "SHA256:11" });
    fixture.agent->unreachable_urls = { "wss://b:3001" };

    WHEN("a client is requested")
    {
      std::ignore = fixture.get(fixture.manager->get_connected_client("peer-1"));

      THEN("each endpoint uses its own URL with the best secrets available")
      {
        REQUIRE(fixture.agent->opened_credentials.size() == 2);
        CHECK(fixture.agent->opened_credentials[0].auth_token == "legacy-token");
        CHECK(fixture.agent->opened_credentials[1].url == "wss://c:3001");
        CHECK(fixture.agent->opened_credentials[1].auth_token == "direct-token");
        CHECK(fixture.agent->opened_credentials[1].cert_fingerprint == "SHA256:11");
      }
    }
  }
}

SCENARIO("Peers without endpoints connect with their single credential set", "[registry][peer_manager][legacy]")
{
  GIVEN("A legacy peer")
  {
    manager_fixture fixture;
    fixture.manager->add_peer(plain_credentials("wss://legacy:3001"), "peer-1", "Box");

    WHEN("it is connected")
    {
      CHECK(fixture.get(fixture.manager->connect_peer("peer-1")));

      THEN("the stored URL was used and no transport is reported")
      {
        CHECK(fixture.agent->opened_urls == std::vector<std::string>{ "wss://legacy:3001" });
        CHECK(fixture.peer().status == connection_status::connected);
        CHECK_FALSE(fixture.manager->active_transport("peer-1").has_value());

        const auto seen = fixture.published();
        REQUIRE_FALSE(seen.empty());
        const auto *connected = std::get_if<events::peer_connected>(&seen.back());
        REQUIRE(connected != nullptr);
        CHECK_FALSE(connected->via.has_value());
        CHECK_FALSE(connected->resumed);
      }

      AND_WHEN("its credentials are replaced")
      {
        fixture.get(fixture.manager->update_peer_credentials("peer-1", plain_credentials("wss://new:3001")));

        THEN("the old connection is closed and the session forgotten")
        {
          CHECK(fixture.agent->close_count == 1);
          CHECK(fixture.peer().url == "wss://new:3001");
          CHECK_FALSE(fixture.peer().session_id.has_value());
          CHECK(fixture.peer().status == connection_status::disconnected);
        }

        AND_WHEN("it connects again")
        {
          CHECK(fixture.get(fixture.manager->connect_peer("peer-1")));
          THEN("the new URL is used") { CHECK(fixture.agent->opened_urls.back() == "wss://new:3001"); }
        }
      }
    }
  }

  GIVEN("A peer with no stored credentials")
  {
    manager_fixture fixture;
    fixture.peers->add(tether::core::peer{ .id = "peer-1", .bridge_id = std::nullopt, .name = "Box", .url = "wss://x:1" });

    THEN("connecting reports it unreachable without opening anything")
    {
      CHECK_FALSE(fixture.get(fixture.manager->connect_peer("peer-1")));
      CHECK(fixture.agent->opened_urls.empty());

      const auto seen = fixture.published();
      REQUIRE_FALSE(seen.empty());
      const auto *unreachable = std::get_if<events::peer_unreachable>(&seen.back());
      REQUIRE(unreachable != nullptr);
      CHECK(unreachable->error == "No stored credentials");
    }
  }

  GIVEN("An unknown peer id")
  {
    manager_fixture fixture;

    THEN("requests for it are rejected")
    {
      REQUIRE_THROWS_AS(fixture.get(fixture.manager->get_connected_client("nobody")), std::invalid_argument);
      REQUIRE_THROWS_AS(fixture.get(fixture.manager->remove_peer("nobody")), std::invalid_argument);
    }
  }
}

SCENARIO("Live connections are shared", "[registry][peer_manager][reuse]")
{
  GIVEN("A connected peer")
  {
    manager_fixture fixture;
    fixture.add_three_endpoint_peer();
    auto first = fixture.get(fixture.manager->get_connected_client("peer-1"));

    WHEN("the client is requested again")
    {
      auto second = fixture.get(fixture.manager->get_connected_client("peer-1"));

      THEN("the same connection is returned without reconnecting")
      {
        CHECK(second == first);
        CHECK(fixture.agent->opened_urls.size() == 1);
        CHECK_FALSE(fixture.manager->attempt_in_flight("peer-1"));
      }
    }

    WHEN("a sweep runs")
    {
      THEN("live peers are left alone") { CHECK(fixture.manager->sweep_once() == 0); }
    }
  }

  GIVEN("Two callers asking at the same time")
  {
    manager_fixture fixture;
    fixture.add_three_endpoint_peer();
    const std::string peer_id{ "peer-1" };

    auto first = boost::asio::co_spawn(
      *fixture.io_context, fixture.manager->get_connected_client(peer_id), boost::asio::use_future);
    auto second = boost::asio::co_spawn(
      *fixture.io_context, fixture.manager->get_connected_client(peer_id), boost::asio::use_future);
    fixture.drain();

    THEN("one connection is opened and both get it")
    {
      auto first_client = first.get();
      CHECK(first_client != nullptr);
      CHECK(second.get() == first_client);
      CHECK(fixture.agent->opened_urls.size() == 1);
    }
  }
}

SCENARIO("Sessions survive reconnects until cleared", "[registry][peer_manager][session]")
{
  GIVEN("A connected peer")
  {
    manager_fixture fixture;
    fixture.add_three_endpoint_peer();
    std::ignore = fixture.get(fixture.manager->get_connected_client("peer-1"));

    WHEN("everything is disconnected and the peer reconnects")
    {
      fixture.get(fixture.manager->disconnect_all());
      CHECK(fixture.peer().status == connection_status::disconnected);
      std::ignore = fixture.published();

      std::ignore = fixture.get(fixture.manager->get_connected_client("peer-1"));

      THEN("the stored session is resumed")
      {
        CHECK(fixture.agent->loaded_sessions == std::vector<std::string>{ "session-1" });
        CHECK(fixture.peer().session_id == "session-1");

        const auto seen = fixture.published();
        REQUIRE_FALSE(seen.empty());
        const auto *connected = std::get_if<events::peer_connected>(&seen.back());
        REQUIRE(connected != nullptr);
        CHECK(connected->resumed);
      }
    }

    WHEN("the session is cleared")
    {
      fixture.get(fixture.manager->clear_session("peer-1"));

      THEN("the connection is closed and the next connect starts fresh")
      {
        CHECK(fixture.agent->close_count == 1);
        CHECK_FALSE(fixture.peer().session_id.has_value());
        CHECK(fixture.peer().status == connection_status::disconnected);

        std::ignore = fixture.get(fixture.manager->get_connected_client("peer-1"));
        CHECK(fixture.agent->loaded_sessions.empty());
        CHECK(fixture.peer().session_id == "session-2");
      }
    }

    WHEN("the transport drops and a sweep runs")
    {
      fixture.connector->drop_all();
      CHECK(fixture.manager->sweep_once() == 1);
      fixture.drain();

      THEN("the peer is reconnected with its session")
      {
        CHECK(fixture.agent->opened_urls.size() == 2);
        CHECK(fixture.agent->loaded_sessions == std::vector<std::string>{ "session-1" });
        CHECK(fixture.peer().status == connection_status::connected);
        CHECK(tether::core::status_consistent(fixture.peer()));
      }
    }
  }
}

SCENARIO("Pairing registers transports against one peer", "[registry][peer_manager][pairing]")
{
  GIVEN("No peers")
  {
    manager_fixture fixture;

    WHEN("a direct transport is paired")
    {
      const auto direct = connection_credentials{ .url = "wss://10.0.0.5:3001", .auth_token = "tok", .cert_fingerprint = "SHA256:11" };
      const auto first =
        fixture.manager->register_paired(direct, transport_kind::direct_pinned, "Box", std::string{ "bridge-1" });

      THEN("a peer is created with one endpoint")
      {
        CHECK(first.new_peer);
        CHECK(first.message == "Added Local Network to Box");
        CHECK(first.peer.bridge_id == "bridge-1");
        REQUIRE(first.peer.endpoints.size() == 1);
        CHECK(fixture.credentials->contains(first.peer.endpoints.front().id));
        CHECK(fixture.credentials->contains(first.peer.id));
      }

      AND_WHEN("a mesh transport from the same bridge is paired")
      {
        const auto second = fixture.manager->register_paired(
          plain_credentials("wss://box.ts.net"), transport_kind::mesh_trusted, "", std::string{ "bridge-1" });

        THEN("it joins the existing peer")
        {
          CHECK_FALSE(second.new_peer);
          CHECK(second.peer.id == first.peer.id);
          CHECK(second.message == "Added Mesh (trusted) to Box");
          CHECK(fixture.manager->endpoints(first.peer.id).size() == 2);
          CHECK(fixture.peers->list().size() == 1);
        }

        AND_WHEN("the mesh transport is paired again without a bridge id")
        {
          const auto third = fixture.manager->register_paired(
            plain_credentials("wss://box.ts.net/"), transport_kind::mesh_trusted, "", std::nullopt);

          THEN("the peer is found by URL and the endpoint updated")
          {
            CHECK_FALSE(third.new_peer);
            CHECK(third.peer.id == first.peer.id);
            CHECK(third.message == "Updated Mesh (trusted) for Box");
            CHECK(fixture.manager->endpoints(first.peer.id).size() == 2);
          }
        }

        AND_WHEN("the peer is removed")
        {
          fixture.get(fixture.manager->remove_peer(first.peer.id));

          THEN("its record and every credential are gone")
          {
            CHECK(fixture.peers->list().empty());
            CHECK(fixture.credentials->size() == 0);
          }
        }
      }
    }

    THEN("unusable credentials are rejected")
    {
      REQUIRE_THROWS_AS(fixture.manager->register_paired(
                          plain_credentials("ftp://box"), transport_kind::direct_pinned, "Box", std::nullopt),
        tether::core::validation_error);
      CHECK(fixture.peers->list().empty());
    }
  }
}

SCENARIO("Endpoints can be deleted", "[registry][peer_manager][endpoints]")
{
  GIVEN("A peer connected through its mesh endpoint")
  {
    manager_fixture fixture;
    fixture.add_three_endpoint_peer();
    std::ignore = fixture.get(fixture.manager->get_connected_client("peer-1"));
    const auto mesh_id = tether::core::active_endpoint(fixture.peer())->id;
    fixture.credentials->save(mesh_id, plain_credentials("wss://b:3001"));

    WHEN("the live endpoint is deleted")
    {
      CHECK(fixture.get(fixture.manager->delete_endpoint("peer-1", mesh_id)));

      THEN("the connection is closed and the endpoint and its secrets are gone")
      {
        CHECK(fixture.agent->close_count == 1);
        CHECK_FALSE(fixture.credentials->contains(mesh_id));
        CHECK(fixture.manager->endpoints("peer-1").size() == 2);
        CHECK(fixture.peer().status == connection_status::disconnected);
      }
    }

    WHEN("an unknown endpoint is deleted")
    {
      THEN("nothing happens")
      {
        CHECK_FALSE(fixture.get(fixture.manager->delete_endpoint("peer-1", "missing")));
        CHECK(fixture.agent->close_count == 0);
      }
    }
  }
}

SCENARIO("The background sweep stops when cancelled", "[registry][peer_manager][sweep]")
{
  GIVEN("A running sweep")
  {
    manager_fixture fixture;
    auto signal = std::make_shared<boost::asio::cancellation_signal>();
    auto slot = std::make_shared<boost::asio::cancellation_slot>(signal->slot());

    auto done = boost::asio::co_spawn(*fixture.io_context, fixture.manager->run(slot), boost::asio::use_future);
    fixture.io_context->poll();

    WHEN("it is cancelled")
    {
      signal->emit(boost::asio::cancellation_type::terminal);
      fixture.io_context->run();

      THEN("it ends with a cancellation error") { REQUIRE_THROWS_AS(done.get(), boost::system::system_error); }
    }
  }
}

SCENARIO("The first endpoint of a connected legacy peer keeps the store consistent", "[registry][peer_manager][endpoints]")
{
  GIVEN("A legacy peer connected through its stored URL")
  {
    manager_fixture fixture;
    fixture.manager->add_peer(plain_credentials("wss://legacy:3001"), "peer-1", "Box");
    auto legacy = fixture.get(fixture.manager->get_connected_client("peer-1"));
    REQUIRE(legacy != nullptr);

    WHEN("an endpoint with another URL is registered")
    {
      fixture.manager->register_endpoint("peer-1", transport_kind::mesh_trusted, plain_credentials("wss://b:3001"));
      fixture.drain();

      THEN("the legacy connection is closed and the peer reported disconnected")
      {
        CHECK(tether::core::status_consistent(fixture.peer()));
        CHECK(fixture.peer().status == connection_status::disconnected);
        CHECK(fixture.agent->close_count == 1);
        CHECK_FALSE(legacy->is_connected());
      }

      AND_WHEN("the peer connects again")
      {
        std::ignore = fixture.get(fixture.manager->get_connected_client("peer-1"));

        THEN("it goes through the new endpoint")
        {
          CHECK(fixture.agent->opened_urls.back() == "wss://b:3001");
          CHECK(fixture.manager->active_transport("peer-1") == transport_kind::mesh_trusted);
          CHECK(tether::core::status_consistent(fixture.peer()));
        }
      }
    }

    WHEN("an endpoint with the stored URL is registered")
    {
      fixture.manager->register_endpoint("peer-1", transport_kind::direct_pinned, plain_credentials("wss://legacy:3001"));
      fixture.drain();

      THEN("the live connection is kept and runs through that endpoint")
      {
        CHECK(tether::core::status_consistent(fixture.peer()));
        CHECK(fixture.peer().status == connection_status::connected);
        CHECK(fixture.manager->active_transport("peer-1") == transport_kind::direct_pinned);
        CHECK(fixture.agent->close_count == 0);
        CHECK(fixture.get(fixture.manager->get_connected_client("peer-1")) == legacy);
        CHECK(fixture.agent->opened_urls.size() == 1);
      }
    }
  }
}

SCENARIO("Changing a peer abandons its connection attempt", "[registry][peer_manager][attempts]")
{
  GIVEN("A legacy peer with a stored session whose next attempt is waiting to retry")
  {
    manager_fixture fixture(patient_profile());
    fixture.manager->add_peer(plain_credentials("wss://legacy:3001"), "peer-1", "Box");
    std::ignore = fixture.get(fixture.manager->get_connected_client("peer-1"));
    fixture.get(fixture.manager->disconnect_all());
    REQUIRE(fixture.peer().session_id == "session-1");

    fixture.agent->failures_before_success = 1;
    const std::string peer_id{ "peer-1" };
    auto attempt =
      boost::asio::co_spawn(*fixture.io_context, fixture.manager->get_connected_client(peer_id), boost::asio::use_future);
    fixture.io_context->poll();
    REQUIRE(fixture.manager->attempt_in_flight("peer-1"));

    WHEN("the session is cleared")
    {
      auto cleared =
        boost::asio::co_spawn(*fixture.io_context, fixture.manager->clear_session(peer_id), boost::asio::use_future);
      fixture.drain();
      cleared.get();

      THEN("the attempt ends without bringing the old session back")
      {
        REQUIRE_THROWS_AS(attempt.get(), boost::system::system_error);
        CHECK_FALSE(fixture.manager->attempt_in_flight("peer-1"));
        CHECK_FALSE(fixture.peer().session_id.has_value());
        CHECK(fixture.peer().status == connection_status::disconnected);
        CHECK(fixture.agent->loaded_sessions.empty());
        CHECK(fixture.agent->opened_urls.size() == 2);
      }
    }
  }

  GIVEN("A peer whose attempt holds an open transport mid-handshake")
  {
    manager_fixture fixture;
    fixture.manager->add_peer(plain_credentials("wss://legacy:3001"), "peer-1", "Box");
    fixture.agent->stall_initialize = true;

    const std::string peer_id{ "peer-1" };
    auto attempt =
      boost::asio::co_spawn(*fixture.io_context, fixture.manager->get_connected_client(peer_id), boost::asio::use_future);
    fixture.io_context->poll();
    REQUIRE(fixture.connector->connections().size() == 1);

    WHEN("the peer is removed")
    {
      auto removed =
        boost::asio::co_spawn(*fixture.io_context, fixture.manager->remove_peer(peer_id), boost::asio::use_future);
      fixture.drain();
      removed.get();

      THEN("the half-open transport is closed and nothing is left behind")
      {
        REQUIRE_THROWS_AS(attempt.get(), boost::system::system_error);
        CHECK_FALSE(fixture.peers->find("peer-1").has_value());
        CHECK(fixture.credentials->size() == 0);
        CHECK_FALSE(fixture.connector->connections().front()->is_open());
        CHECK(fixture.agent->close_count == 1);
        CHECK(fixture.agent->sessions_created == 0);
      }
    }

    WHEN("its credentials are replaced")
    {
      auto updated = boost::asio::co_spawn(*fixture.io_context,
        fixture.manager->update_peer_credentials(peer_id, plain_credentials("wss://new:3001")),
        boost::asio::use_future);
      fixture.drain();
      updated.get();

      THEN("the connection made with the old credentials is not adopted")
      {
        REQUIRE_THROWS_AS(attempt.get(), boost::system::system_error);
        CHECK(fixture.agent->close_count == 1);
        CHECK(fixture.peer().url == "wss://new:3001");
        CHECK(fixture.peer().status == connection_status::disconnected);
        CHECK_FALSE(fixture.manager->attempt_in_flight("peer-1"));
      }

      AND_WHEN("it connects again")
      {
        CHECK_THROWS_AS(attempt.get(), boost::system::system_error);
        fixture.agent->stall_initialize = false;
        auto client = fixture.get(fixture.manager->get_connected_client(peer_id));

        THEN("the new credentials are used")
        {
          REQUIRE(client != nullptr);
          CHECK(client->credentials().url == "wss://new:3001");
          CHECK(fixture.agent->opened_urls.back() == "wss://new:3001");
        }
      }
    }
  }
}

SCENARIO("A dropped transport is reflected in the peer's status", "[registry][peer_manager][session]")
{
  GIVEN("A peer connected through its mesh endpoint")
  {
    manager_fixture fixture;
    fixture.add_three_endpoint_peer();
    std::ignore = fixture.get(fixture.manager->get_connected_client("peer-1"));
    std::ignore = fixture.published();

    WHEN("the transport drops")
    {
      fixture.connector->drop_all();

      THEN("the peer is disconnected with no active endpoint")
      {
        CHECK(fixture.peer().status == connection_status::disconnected);
        CHECK_FALSE(fixture.manager->active_transport("peer-1").has_value());
        CHECK(tether::core::status_consistent(fixture.peer()));

        const auto seen = fixture.published();
        REQUIRE(seen.size() == 1);
        const auto *changed = std::get_if<events::peer_status_changed>(&seen.front());
        REQUIRE(changed != nullptr);
        CHECK(changed->status == connection_status::disconnected);
      }
    }
  }
}
