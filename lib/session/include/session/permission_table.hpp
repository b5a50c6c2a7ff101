#pragma once

#include <acp/types.hpp>
#include <async/oneshot.hpp>
#include <session/errors.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace tether::session {

/**
 * @brief Permission requests waiting for the user, keyed by tool call id.
 *
 * Each entry owns a oneshot channel; the protocol call that raised the request stays suspended on
 * it until resolve() or cancel_all() delivers an outcome. Entries are independent, so several
 * requests can be outstanding at once. Single executor only.
 */
class permission_table : public std::enable_shared_from_this<permission_table>
{
private:
  struct pending_entry
  {
    explicit pending_entry(const std::shared_ptr<boost::asio::io_context> &io_context, acp::permission_request req)
      : request(std::move(req)), result(io_context)
    {}

    acp::permission_request request;
    async::oneshot<acp::permission_outcome> result;
    std::unique_ptr<boost::asio::steady_timer> expiry;
  };

public:
  using notify_t = std::function<void(const acp::permission_request &)>;

  explicit permission_table(const std::shared_ptr<boost::asio::io_context> &io_context) : io_context_(io_context) {}

  permission_table(const permission_table &) = delete;
  auto operator=(const permission_table &) -> permission_table & = delete;
  permission_table(permission_table &&) = delete;
  auto operator=(permission_table &&) -> permission_table & = delete;
  ~permission_table() = default;

  /**
   * @brief Registers the request, tells the user about it, and waits for the answer.
   *
   * The entry exists before `notify` runs, so a handler that answers synchronously is fine.
   * A repeated tool call id cancels the older request.
   *
   * @param timeout When set, the request is answered cancelled once it elapses
   */
  auto await_decision(acp::permission_request request,
    std::optional<std::chrono::milliseconds> timeout,
    notify_t notify) -> boost::asio::awaitable<acp::permission_outcome>
  {
    const auto tool_call_id = request.tool_call_id;
    auto entry = std::make_shared<pending_entry>(io_context_, std::move(request));

    if (auto existing = pending_.find(tool_call_id); existing != pending_.end()) {
      spdlog::debug("[permissions] Replacing pending request for {}", tool_call_id);
      existing->second->result.set_value(acp::permission_outcome::cancelled());
    }
    pending_[tool_call_id] = entry;

    if (timeout) {
      entry->expiry = std::make_unique<boost::asio::steady_timer>(*io_context_, *timeout);
      entry->expiry->async_wait(
        [weak_entry = std::weak_ptr<pending_entry>(entry), tool_call_id](const boost::system::error_code &error) {
          if (error) { return; }
          if (auto expired = weak_entry.lock(); expired and expired->result.set_value(acp::permission_outcome::cancelled())) {
            spdlog::warn("[permissions] Request for {} timed out", tool_call_id);
          }
        });
    }

    if (notify) { notify(entry->request); }

    auto outcome = co_await entry->result.get();

    if (auto current = pending_.find(tool_call_id); current != pending_.end() and current->second == entry) {
      pending_.erase(current);
    }
    if (entry->expiry) { entry->expiry->cancel(); }
    co_return outcome;
  }

  /**
   * @brief Answers a pending request.
   *
   * @throws session_error (unknown_tool_call) when nothing is pending under that id
   */
  auto resolve(const std::string &tool_call_id, acp::permission_outcome outcome) -> void
  {
    auto found = pending_.find(tool_call_id);
    if (found == pending_.end()) { throw session_error::unknown_tool_call(tool_call_id); }

    auto entry = found->second;
    pending_.erase(found);
    entry->result.set_value(std::move(outcome));
  }

  /// Answers every pending request with cancelled.
  auto cancel_all() -> void
  {
    auto entries = std::exchange(pending_, {});
    for (auto &[id, entry] : entries) {
      spdlog::debug("[permissions] Cancelling pending request for {}", id);
      entry->result.set_value(acp::permission_outcome::cancelled());
    }
  }

  [[nodiscard]] auto pending_ids() const -> std::vector<std::string>
  {
    std::vector<std::string> ids;
    ids.reserve(pending_.size());
    for (const auto &[id, entry] : pending_) { ids.push_back(id); }
    return ids;
  }

  [[nodiscard]] auto pending_count() const -> std::size_t { return pending_.size(); }

  [[nodiscard]] auto options(const std::string &tool_call_id) const -> std::optional<std::vector<acp::permission_option>>
  {
    auto found = pending_.find(tool_call_id);
    if (found == pending_.end()) { return std::nullopt; }
    return found->second->request.options;
  }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  std::map<std::string, std::shared_ptr<pending_entry>> pending_;
};

}// namespace tether::session
