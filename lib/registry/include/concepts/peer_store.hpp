#pragma once

#include <core/peer.hpp>
#include <core/transport_kind.hpp>

#include <concepts>
#include <optional>
#include <string>
#include <vector>

namespace tether::concepts {

/**
 * @brief Peer and endpoint records with change observation.
 *
 * Every mutation that touches an endpoint's active flag recomputes the peer status in the same
 * step, so observers never see the two disagree.
 */
template<typename T>
concept peer_store = requires(T &store,
  const core::peer &record,
  const std::string &id,
  core::transport_kind kind,
  core::connection_status status,
  std::optional<core::transport_kind> preferred,
  bool flag,
  int priority) {
  { store.list() } -> std::same_as<std::vector<core::peer>>;
  { store.find(id) } -> std::same_as<std::optional<core::peer>>;
  { store.find_by_bridge_id(id) } -> std::same_as<std::optional<core::peer>>;
  { store.add(record) } -> std::same_as<void>;
  { store.remove(id) } -> std::same_as<bool>;
  store.upsert_endpoint(id, kind, id, priority);
  { store.remove_endpoint(id, id) } -> std::same_as<bool>;
  { store.set_endpoint_active(id, id, flag) } -> std::same_as<void>;
  { store.set_status(id, status) } -> std::same_as<void>;
  { store.update_session(id, id, flag) } -> std::same_as<void>;
  { store.clear_session(id) } -> std::same_as<void>;
  { store.set_preferred_transport(id, preferred) } -> std::same_as<void>;
  { store.update_url(id, id) } -> std::same_as<void>;
};

}// namespace tether::concepts
