#pragma once

#include <acp/types.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tether::acp {

/**
 * @brief Matches JSON-RPC responses to the requests awaiting them.
 *
 * Each request id gets a timer; a response or a failure for that id cancels the timer and wakes
 * the waiting coroutine. Cancelling the waiting coroutine itself abandons the request. Must be used
 * from a single executor.
 */
class request_tracker
{
private:
  struct completion
  {
    std::optional<nlohmann::json> response;
    std::optional<std::string> failure;
    std::optional<boost::asio::steady_timer> timer;
  };

public:
  request_tracker() = default;

  [[nodiscard]] auto has_pending(std::int64_t id) const -> bool { return pending_.contains(id); }
  [[nodiscard]] auto pending_count() const -> std::size_t { return pending_.size(); }

  /**
   * @brief Waits for the response to request `id`.
   *
   * Registration happens before the first suspension, so a response that arrives as soon as the
   * request is written is still matched.
   *
   * @return The `result` member of the response
   * @throws rpc_error when the agent answered with an error object
   * @throws std::runtime_error on timeout or when the request was failed by fail_all()
   * @throws boost::system::system_error (operation_aborted) when the awaiting coroutine is cancelled
   */
  [[nodiscard]] auto async_track(std::int64_t id, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<nlohmann::json>
  {
    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<completion>();
    state->timer.emplace(executor, timeout);
    pending_[id] = state;

    boost::system::error_code error_code;
    co_await state->timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error_code));

    pending_.erase(id);

    if (state->response) {
      const auto &message = *state->response;
      if (message.contains("error")) {
        const auto &error = message.at("error");
        throw rpc_error(error.value("code", 0), error.value("message", std::string{ "Unknown error" }));
      }
      co_return message.value("result", nlohmann::json{});
    }
    if (state->failure) { throw std::runtime_error(*state->failure); }
    if (error_code == boost::asio::error::operation_aborted) {
      throw boost::system::system_error(boost::asio::error::operation_aborted);
    }

    throw std::runtime_error("Request timeout");
  }

  /**
   * @brief Delivers a response message. Unknown ids (late or duplicate responses) are ignored.
   */
  auto resolve(std::int64_t id, nlohmann::json message) -> void
  {
    auto iter = pending_.find(id);
    if (iter == pending_.end() or iter->second->response or iter->second->failure) { return; }
    iter->second->response = std::move(message);
    iter->second->timer->cancel();
  }

  /**
   * @brief Fails every outstanding request, e.g. when the connection drops.
   */
  auto fail_all(const std::string &reason) -> void
  {
    std::vector<std::shared_ptr<completion>> waiting;
    waiting.reserve(pending_.size());
    for (auto &[id, state] : pending_) { waiting.push_back(state); }

    for (auto &state : waiting) {
      if (state->response or state->failure) { continue; }
      state->failure = reason;
      state->timer->cancel();
    }
  }

private:
  std::unordered_map<std::int64_t, std::shared_ptr<completion>> pending_;
};

}// namespace tether::acp
