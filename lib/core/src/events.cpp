#include <core/events.hpp>
#include <core/overload.hpp>

#include <fmt/format.h>

namespace tether::core::events {

auto describe(const peer_event_t &event) -> std::string
{
  return std::visit(
    overload{
      [](const endpoint_attempt &attempt) {
        return fmt::format("{}: trying {} ({})", attempt.peer_id, display_name(attempt.kind), attempt.url);
      },
      [](const endpoint_failed &failed) {
        return fmt::format("{}: {} failed: {}", failed.peer_id, display_name(failed.kind), failed.error);
      },
      [](const peer_connected &connected) {
        const auto via = connected.via ? std::string(display_name(*connected.via)) : std::string{ "direct" };
        return fmt::format("{}: connected via {} ({} session {})",
          connected.peer_id,
          via,
          connected.resumed ? "resumed" : "new",
          connected.session_id);
      },
      [](const peer_unreachable &unreachable) {
        return fmt::format("{}: unreachable: {}", unreachable.peer_id, unreachable.error);
      },
      [](const peer_status_changed &changed) {
        return fmt::format("{}: {}", changed.peer_id, to_string(changed.status));
      },
    },
    event);
}

}// namespace tether::core::events
