#pragma once

#include <core/peer.hpp>
#include <core/transport_kind.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether::registry {

/// Result of registering a transport for a peer.
struct upsert_result
{
  core::transport_endpoint endpoint;
  bool created{ false };///< False when an endpoint of the same kind was updated in place
};

/**
 * @brief Peer and endpoint records, optionally persisted as JSON.
 *
 * Thread-safe. Observers are called after every mutation with a snapshot of all peers, outside
 * the store lock. Operations naming a peer that does not exist throw std::invalid_argument.
 */
class peer_store
{
public:
  using observer_t = std::function<void(const std::vector<core::peer> &)>;
  using subscription_id = std::uint64_t;

  peer_store() = default;

  /**
   * @brief Loads existing records from `path` if the file exists.
   *
   * Loaded peers start disconnected with no active endpoint.
   *
   * @throws std::runtime_error when the file exists but cannot be parsed
   */
  explicit peer_store(std::filesystem::path path);

  [[nodiscard]] auto list() -> std::vector<core::peer>;
  [[nodiscard]] auto find(const std::string &peer_id) -> std::optional<core::peer>;
  [[nodiscard]] auto find_by_bridge_id(const std::string &bridge_id) -> std::optional<core::peer>;

  /// @throws std::invalid_argument when a peer with the same id exists
  auto add(const core::peer &record) -> void;

  /// @return false when there was no such peer
  auto remove(const std::string &peer_id) -> bool;

  /**
   * @brief Creates the endpoint of `kind` for a peer, or updates its URL and priority in place.
   *
   * When the first endpoint is added to a connected peer, it becomes the active endpoint if its URL
   * is the peer's stored URL; otherwise the peer drops to disconnected.
   */
  auto upsert_endpoint(const std::string &peer_id, core::transport_kind kind, const std::string &url, int priority)
    -> upsert_result;

  /// @return false when the peer has no such endpoint
  auto remove_endpoint(const std::string &peer_id, const std::string &endpoint_id) -> bool;

  /**
   * @brief Marks one endpoint live or not and recomputes the peer status.
   *
   * Activating an endpoint deactivates every other endpoint of the peer, stamps the connection
   * time, and makes the peer connected. Deactivating the last active endpoint of a connected peer
   * makes it disconnected.
   */
  auto set_endpoint_active(const std::string &peer_id, const std::string &endpoint_id, bool active) -> void;

  /**
   * @brief Sets the peer status.
   *
   * For peers with endpoints, disconnected and reconnecting clear every active flag, and connected
   * is only accepted while an endpoint is active.
   *
   * @throws std::logic_error when connected is requested with no active endpoint
   */
  auto set_status(const std::string &peer_id, core::connection_status status) -> void;

  auto update_session(const std::string &peer_id, const std::string &session_id, bool supports_load_session) -> void;
  auto clear_session(const std::string &peer_id) -> void;
  auto set_preferred_transport(const std::string &peer_id, std::optional<core::transport_kind> kind) -> void;
  auto update_url(const std::string &peer_id, const std::string &url) -> void;

  auto subscribe(observer_t observer) -> subscription_id;
  auto unsubscribe(subscription_id id) -> void;

private:
  template<typename Mutation> auto mutate(const std::string &peer_id, Mutation &&mutation);

  auto snapshot_locked() const -> std::vector<core::peer>;
  auto persist_locked() const -> void;
  auto notify(const std::vector<core::peer> &peers) -> void;

  std::optional<std::filesystem::path> path_;
  std::mutex mutex_;
  std::vector<core::peer> peers_;

  std::mutex observers_mutex_;
  std::map<subscription_id, observer_t> observers_;
  subscription_id next_subscription_{ 1 };
};

}// namespace tether::registry
