#include <security/trust_policy.hpp>

#include <stdexcept>

namespace tether::security {

auto make_trust_policy(const std::optional<std::string> &fingerprint) -> trust_policy
{
  if (fingerprint and not fingerprint->empty()) {
    return pinned_trust{ .validator = std::make_shared<fingerprint_validator>(*fingerprint) };
  }
  return system_trust{};
}

auto trust_policy_for(core::transport_kind kind, const std::optional<std::string> &fingerprint) -> trust_policy
{
  if (not core::uses_pinning(kind)) { return system_trust{}; }

  if (not fingerprint or fingerprint->empty()) {
    throw std::invalid_argument(std::string(core::to_string(kind)) + " requires a certificate fingerprint");
  }
  return make_trust_policy(fingerprint);
}

auto pinned_validator(const trust_policy &policy) -> std::shared_ptr<fingerprint_validator>
{
  if (const auto *pinned = std::get_if<pinned_trust>(&policy)) { return pinned->validator; }
  return nullptr;
}

auto describe(const trust_policy &policy) -> std::string_view
{
  return std::holds_alternative<pinned_trust>(policy) ? "certificate pinning" : "system trust";
}

auto make_client_context() -> boost::asio::ssl::context
{
  boost::asio::ssl::context context(boost::asio::ssl::context::tlsv12_client);
  context.set_default_verify_paths();
  return context;
}

}// namespace tether::security
