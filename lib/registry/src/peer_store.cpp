#include <registry/peer_store.hpp>

#include <concepts/peer_store.hpp>
#include <core/identity.hpp>
#include <core/peer.hpp>

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <type_traits>

namespace tether::registry {

static_assert(concepts::peer_store<peer_store>);

namespace {
  auto find_record(std::vector<core::peer> &peers, const std::string &peer_id) -> core::peer &
  {
    auto found = std::find_if(peers.begin(), peers.end(), [&peer_id](const auto &record) { return record.id == peer_id; });
    if (found == peers.end()) { throw std::invalid_argument("Unknown peer: " + peer_id); }
    return *found;
  }

  auto clear_active(core::peer &record) -> void
  {
    for (auto &endpoint : record.endpoints) { endpoint.active = false; }
  }
}// namespace

peer_store::peer_store(std::filesystem::path path) : path_(std::move(path))
{
  if (not std::filesystem::exists(*path_)) { return; }

  std::ifstream input(*path_);
  auto document = nlohmann::json::parse(input, nullptr, false);
  if (document.is_discarded() or not document.is_array()) {
    throw std::runtime_error("Peer file is corrupt: " + path_->string());
  }

  try {
    peers_ = document.get<std::vector<core::peer>>();
  } catch (const nlohmann::json::exception &error) {
    throw std::runtime_error("Peer file is corrupt: " + path_->string() + ": " + error.what());
  }
  spdlog::debug("[peer_store] Loaded {} peers", peers_.size());
}

template<typename Mutation> auto peer_store::mutate(const std::string &peer_id, Mutation &&mutation)
{
  std::vector<core::peer> snapshot;
  if constexpr (std::is_void_v<std::invoke_result_t<Mutation, core::peer &>>) {
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      mutation(find_record(peers_, peer_id));
      persist_locked();
      snapshot = snapshot_locked();
    }
    notify(snapshot);
  } else {
    std::invoke_result_t<Mutation, core::peer &> result;
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      result = mutation(find_record(peers_, peer_id));
      persist_locked();
      snapshot = snapshot_locked();
    }
    notify(snapshot);
    return result;
  }
}

auto peer_store::list() -> std::vector<core::peer>
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_locked();
}

auto peer_store::find(const std::string &peer_id) -> std::optional<core::peer>
{
  const std::lock_guard<std::mutex> lock(mutex_);
  auto found = std::find_if(peers_.begin(), peers_.end(), [&peer_id](const auto &record) { return record.id == peer_id; });
  if (found == peers_.end()) { return std::nullopt; }
  return *found;
}

auto peer_store::find_by_bridge_id(const std::string &bridge_id) -> std::optional<core::peer>
{
  const std::lock_guard<std::mutex> lock(mutex_);
  auto found = std::find_if(
    peers_.begin(), peers_.end(), [&bridge_id](const auto &record) { return record.bridge_id == bridge_id; });
  if (found == peers_.end()) { return std::nullopt; }
  return *found;
}

auto peer_store::add(const core::peer &record) -> void
{
  std::vector<core::peer> snapshot;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto exists =
      std::any_of(peers_.begin(), peers_.end(), [&record](const auto &existing) { return existing.id == record.id; });
    if (exists) { throw std::invalid_argument("Peer already exists: " + record.id); }
    peers_.push_back(record);
    persist_locked();
    snapshot = snapshot_locked();
  }
  notify(snapshot);
}

auto peer_store::remove(const std::string &peer_id) -> bool
{
  std::vector<core::peer> snapshot;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto removed =
      std::erase_if(peers_, [&peer_id](const auto &record) { return record.id == peer_id; });
    if (removed == 0) { return false; }
    persist_locked();
    snapshot = snapshot_locked();
  }
  notify(snapshot);
  return true;
}

auto peer_store::upsert_endpoint(const std::string &peer_id,
  core::transport_kind kind,
  const std::string &url,
  int priority) -> upsert_result
{
  return mutate(peer_id, [&](core::peer &record) {
    auto existing = std::find_if(
      record.endpoints.begin(), record.endpoints.end(), [kind](const auto &endpoint) { return endpoint.kind == kind; });
    if (existing != record.endpoints.end()) {
      existing->url = url;
      existing->priority = priority;
      return upsert_result{ .endpoint = *existing, .created = false };
    }

    const bool was_legacy = record.endpoints.empty();
    record.endpoints.push_back(core::transport_endpoint{ .id = core::new_endpoint_id(),
      .kind = kind,
      .url = url,
      .priority = priority,
      .active = false,
      .last_connected_at = std::nullopt });

    // A connected legacy peer is connected through its stored URL; that is now either this
    // endpoint or nothing the endpoint list knows about.
    auto &created = record.endpoints.back();
    if (was_legacy and record.status == core::connection_status::connected) {
      if (core::normalize_url(url) == core::normalize_url(record.url)) {
        created.active = true;
        created.last_connected_at = record.last_connected_at;
      } else {
        record.status = core::connection_status::disconnected;
      }
    }
    return upsert_result{ .endpoint = created, .created = true };
  });
}

auto peer_store::remove_endpoint(const std::string &peer_id, const std::string &endpoint_id) -> bool
{
  return mutate(peer_id, [&endpoint_id](core::peer &record) {
    const auto removed =
      std::erase_if(record.endpoints, [&endpoint_id](const auto &endpoint) { return endpoint.id == endpoint_id; });
    const auto any_active = std::any_of(
      record.endpoints.begin(), record.endpoints.end(), [](const auto &endpoint) { return endpoint.active; });
    if (removed > 0 and not any_active and record.status == core::connection_status::connected) {
      record.status = core::connection_status::disconnected;
    }
    return removed > 0;
  });
}

auto peer_store::set_endpoint_active(const std::string &peer_id, const std::string &endpoint_id, bool active) -> void
{
  mutate(peer_id, [&endpoint_id, active](core::peer &record) {
    auto target = std::find_if(record.endpoints.begin(), record.endpoints.end(), [&endpoint_id](const auto &endpoint) {
      return endpoint.id == endpoint_id;
    });
    if (target == record.endpoints.end()) { throw std::invalid_argument("Unknown endpoint: " + endpoint_id); }

    if (active) {
      const auto now = std::chrono::system_clock::now();
      clear_active(record);
      target->active = true;
      target->last_connected_at = now;
      record.last_connected_at = now;
      record.status = core::connection_status::connected;
      return;
    }

    target->active = false;
    if (record.status == core::connection_status::connected) { record.status = core::connection_status::disconnected; }
  });
}

auto peer_store::set_status(const std::string &peer_id, core::connection_status status) -> void
{
  mutate(peer_id, [status](core::peer &record) {
    if (record.endpoints.empty()) {
      if (status == core::connection_status::connected) { record.last_connected_at = std::chrono::system_clock::now(); }
      record.status = status;
      return;
    }

    if (status == core::connection_status::connected) {
      if (not core::active_endpoint(record)) {
        throw std::logic_error("Peer " + record.id + " cannot be connected without an active endpoint");
      }
    } else {
      clear_active(record);
    }
    record.status = status;
  });
}

auto peer_store::update_session(const std::string &peer_id, const std::string &session_id, bool supports_load_session)
  -> void
{
  mutate(peer_id, [&session_id, supports_load_session](core::peer &record) {
    if (record.session_id != session_id) { record.session_started_at = std::chrono::system_clock::now(); }
    record.session_id = session_id;
    record.supports_load_session = supports_load_session;
  });
}

auto peer_store::clear_session(const std::string &peer_id) -> void
{
  mutate(peer_id, [](core::peer &record) {
    record.session_id.reset();
    record.session_started_at.reset();
  });
}

auto peer_store::set_preferred_transport(const std::string &peer_id, std::optional<core::transport_kind> kind) -> void
{
  mutate(peer_id, [kind](core::peer &record) { record.preferred_transport = kind; });
}

auto peer_store::update_url(const std::string &peer_id, const std::string &url) -> void
{
  mutate(peer_id, [&url](core::peer &record) { record.url = url; });
}

auto peer_store::subscribe(observer_t observer) -> subscription_id
{
  const std::lock_guard<std::mutex> lock(observers_mutex_);
  const auto id = next_subscription_++;
  observers_.emplace(id, std::move(observer));
  return id;
}

auto peer_store::unsubscribe(subscription_id id) -> void
{
  const std::lock_guard<std::mutex> lock(observers_mutex_);
  observers_.erase(id);
}

auto peer_store::snapshot_locked() const -> std::vector<core::peer> { return peers_; }

auto peer_store::persist_locked() const -> void
{
  if (not path_) { return; }

  auto staging = *path_;
  staging += ".tmp";
  {
    std::ofstream output(staging, std::ios::trunc);
    if (not output) { throw std::runtime_error("Cannot write " + staging.string()); }
    output << nlohmann::json(peers_).dump(2);
  }
  std::filesystem::rename(staging, *path_);
}

auto peer_store::notify(const std::vector<core::peer> &peers) -> void
{
  std::vector<observer_t> observers;
  {
    const std::lock_guard<std::mutex> lock(observers_mutex_);
    for (const auto &[id, observer] : observers_) { observers.push_back(observer); }
  }
  for (const auto &observer : observers) { observer(peers); }
}

}// namespace tether::registry
