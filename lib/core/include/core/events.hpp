#pragma once

#include <core/peer.hpp>
#include <core/transport_kind.hpp>

#include <optional>
#include <string>
#include <variant>

namespace tether::core::events {

/// A fallback pass is about to try one endpoint.
struct endpoint_attempt
{
  std::string peer_id;
  transport_kind kind;
  std::string url;
};

/// One endpoint could not be connected; the next one will be tried.
struct endpoint_failed
{
  std::string peer_id;
  transport_kind kind;
  std::string error;
};

/// A peer is now connected.
struct peer_connected
{
  std::string peer_id;
  std::optional<transport_kind> via;///< Empty for legacy peers without endpoints
  std::string session_id;
  bool resumed{ false };
};

/// Every endpoint (or the legacy credential set) failed.
struct peer_unreachable
{
  std::string peer_id;
  std::string error;
};

/// Peer status changed in the store.
struct peer_status_changed
{
  std::string peer_id;
  connection_status status;
};

using peer_event_t = std::variant<endpoint_attempt, endpoint_failed, peer_connected, peer_unreachable, peer_status_changed>;

/// One-line human description, used by `tether watch`.
[[nodiscard]] auto describe(const peer_event_t &event) -> std::string;

}// namespace tether::core::events
