#include <transport/operation_deadline.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace tether::transport {

operation_deadline::operation_deadline(const boost::asio::any_io_executor &executor, std::function<void()> on_expiry)
  : timer_(executor), state_(std::make_shared<state>())
{
  state_->on_expiry = std::move(on_expiry);
}

operation_deadline::~operation_deadline() { state_->armed = false; }

auto operation_deadline::arm(std::chrono::steady_clock::duration timeout) -> void
{
  state_->armed = true;
  state_->expired = false;
  timer_.expires_after(timeout);
  // The wait may complete after disarm() or after this object is gone; only an armed deadline acts.
  timer_.async_wait([current = state_](const boost::system::error_code &error) {
    if (error or not current->armed) { return; }
    current->armed = false;
    current->expired = true;
    spdlog::debug("[transport] Deadline passed, cancelling");
    if (current->on_expiry) { current->on_expiry(); }
  });
}

auto operation_deadline::disarm() -> void
{
  state_->armed = false;
  timer_.cancel();
}

}// namespace tether::transport
