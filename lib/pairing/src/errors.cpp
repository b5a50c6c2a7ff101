#include <pairing/errors.hpp>

#include <security/fingerprint.hpp>

#include <fmt/format.h>

namespace tether::pairing {

auto to_string(error_kind kind) -> std::string_view
{
  switch (kind) {
  case error_kind::invalid_url:
    return "invalid_url";
  case error_kind::missing_code:
    return "missing_code";
  case error_kind::missing_fingerprint:
    return "missing_fingerprint";
  case error_kind::invalid_code:
    return "invalid_code";
  case error_kind::rate_limited:
    return "rate_limited";
  case error_kind::fingerprint_mismatch:
    return "fingerprint_mismatch";
  case error_kind::network:
    return "network";
  case error_kind::invalid_response:
    return "invalid_response";
  case error_kind::unsupported_kind:
    return "unsupported_kind";
  }
  return "unknown";
}

pairing_error::pairing_error(error_kind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

auto pairing_error::invalid_url(std::string_view reason) -> pairing_error
{
  return { error_kind::invalid_url, fmt::format("Invalid pairing URL: {}", reason) };
}

auto pairing_error::missing_code() -> pairing_error
{
  return { error_kind::missing_code, "Pairing code not found in URL" };
}

auto pairing_error::missing_fingerprint() -> pairing_error
{
  return { error_kind::missing_fingerprint, "Certificate fingerprint required for local pairing" };
}

auto pairing_error::invalid_code() -> pairing_error
{
  return { error_kind::invalid_code, "Invalid or expired pairing code" };
}

auto pairing_error::rate_limited() -> pairing_error
{
  return { error_kind::rate_limited, "Too many attempts. Please restart the bridge for a new code." };
}

auto pairing_error::fingerprint_mismatch(const std::string &expected, const std::string &received) -> pairing_error
{
  const security::fingerprint_mismatch mismatch(expected, received);
  pairing_error error(error_kind::fingerprint_mismatch, mismatch.what());
  error.expected_ = expected;
  error.received_ = received;
  return error;
}

auto pairing_error::network(std::string_view reason) -> pairing_error
{
  return { error_kind::network, fmt::format("Network error: {}", reason) };
}

auto pairing_error::invalid_response(std::string_view reason) -> pairing_error
{
  return { error_kind::invalid_response, fmt::format("Invalid response from bridge: {}", reason) };
}

auto pairing_error::unsupported_kind(std::string_view kind) -> pairing_error
{
  return { error_kind::unsupported_kind, fmt::format("Unsupported pairing type: {}", kind) };
}

}// namespace tether::pairing
