#include <core/transport_kind.hpp>

namespace tether::core {

auto to_string(transport_kind kind) -> std::string_view
{
  switch (kind) {
  case transport_kind::direct_pinned:
    return "direct-pinned";
  case transport_kind::relay_gateway:
    return "relay-gateway";
  case transport_kind::mesh_trusted:
    return "mesh-trusted";
  case transport_kind::mesh_pinned:
    return "mesh-pinned";
  }
  return "unknown";
}

auto display_name(transport_kind kind) -> std::string_view
{
  switch (kind) {
  case transport_kind::direct_pinned:
    return "Local Network";
  case transport_kind::relay_gateway:
    return "Relay Tunnel";
  case transport_kind::mesh_trusted:
    return "Mesh (trusted)";
  case transport_kind::mesh_pinned:
    return "Mesh (pinned)";
  }
  return "Unknown";
}

auto parse_transport_kind(std::string_view name) -> std::optional<transport_kind>
{
  for (const auto kind : all_transport_kinds) {
    if (to_string(kind) == name) { return kind; }
  }
  return std::nullopt;
}

auto default_priority(transport_kind kind) -> int
{
  switch (kind) {
  case transport_kind::mesh_trusted:
    return 0;
  case transport_kind::mesh_pinned:
    return 1;
  case transport_kind::relay_gateway:
    return 2;
  case transport_kind::direct_pinned:
    return 3;
  }
  return static_cast<int>(all_transport_kinds.size());
}

auto uses_pinning(transport_kind kind) -> bool
{
  return kind == transport_kind::direct_pinned or kind == transport_kind::mesh_pinned;
}

}// namespace tether::core
