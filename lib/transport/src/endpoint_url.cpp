#include <transport/endpoint_url.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tether::transport {

namespace {
  auto default_port(std::string_view scheme) -> std::string
  {
    return (scheme == "wss" or scheme == "https") ? "443" : "80";
  }

  auto is_port(std::string_view text) -> bool
  {
    return not text.empty() and std::all_of(text.begin(), text.end(), [](unsigned char character) {
      return std::isdigit(character) != 0;
    });
  }
}// namespace

auto parse_endpoint_url(std::string_view url) -> endpoint_url
{
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) { throw std::invalid_argument("URL has no scheme: " + std::string(url)); }

  endpoint_url result;
  result.scheme = std::string(url.substr(0, scheme_end));
  std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(), [](unsigned char character) {
    return static_cast<char>(std::tolower(character));
  });
  if (result.scheme != "ws" and result.scheme != "wss" and result.scheme != "http" and result.scheme != "https") {
    throw std::invalid_argument("Unsupported URL scheme: " + result.scheme);
  }

  auto rest = url.substr(scheme_end + 3);
  const auto authority_end = rest.find_first_of("/?#");
  auto authority = rest.substr(0, authority_end);
  auto target = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);
  target = target.substr(0, target.find('#'));

  if (const auto at = authority.rfind('@'); at != std::string_view::npos) { authority.remove_prefix(at + 1); }

  std::string_view host;
  std::string_view port;
  if (authority.starts_with('[')) {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) { throw std::invalid_argument("Malformed IPv6 host: " + std::string(url)); }
    host = authority.substr(1, close - 1);
    const auto after = authority.substr(close + 1);
    if (after.starts_with(':')) { port = after.substr(1); }
  } else {
    const auto colon = authority.rfind(':');
    host = authority.substr(0, colon);
    if (colon != std::string_view::npos) { port = authority.substr(colon + 1); }
  }

  if (host.empty()) { throw std::invalid_argument("URL has no host: " + std::string(url)); }
  if (not port.empty() and not is_port(port)) { throw std::invalid_argument("Invalid port: " + std::string(port)); }

  result.host = std::string(host);
  result.port = port.empty() ? default_port(result.scheme) : std::string(port);
  result.target = target.empty() ? "/" : std::string(target);
  if (result.target.starts_with('?')) { result.target.insert(0, "/"); }
  return result;
}

}// namespace tether::transport
