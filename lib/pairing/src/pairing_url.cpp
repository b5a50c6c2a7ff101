#include <pairing/pairing_url.hpp>

#include <pairing/errors.hpp>

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <map>

namespace tether::pairing {

namespace {
  constexpr std::string_view pair_prefix = "/pair/";

  auto lowercase(std::string_view text) -> std::string
  {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char character) {
      return static_cast<char>(std::tolower(character));
    });
    return result;
  }

  auto trim(std::string_view text) -> std::string_view
  {
    while (not text.empty() and std::isspace(static_cast<unsigned char>(text.front())) != 0) { text.remove_prefix(1); }
    while (not text.empty() and std::isspace(static_cast<unsigned char>(text.back())) != 0) { text.remove_suffix(1); }
    return text;
  }

  auto hex_value(char digit) -> int
  {
    if (digit >= '0' and digit <= '9') { return digit - '0'; }
    const auto upper = std::toupper(static_cast<unsigned char>(digit));
    if (upper >= 'A' and upper <= 'F') { return upper - 'A' + 10; }// NOLINT(cppcoreguidelines-avoid-magic-numbers)
    return -1;
  }

  auto percent_decode(std::string_view text) -> std::string
  {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t index = 0; index < text.size(); ++index) {
      if (text[index] == '%' and index + 2 < text.size()) {
        const auto high = hex_value(text[index + 1]);
        const auto low = hex_value(text[index + 2]);
        if (high >= 0 and low >= 0) {
          decoded += static_cast<char>((high << 4) | low);// NOLINT(hicpp-signed-bitwise)
          index += 2;
          continue;
        }
      }
      decoded += text[index];
    }
    return decoded;
  }

  auto percent_encode(std::string_view text) -> std::string
  {
    std::string encoded;
    for (const auto character : text) {
      const auto byte = static_cast<unsigned char>(character);
      if (std::isalnum(byte) != 0 or character == '-' or character == '.' or character == '_' or character == '~'
          or character == ':') {
        encoded += character;
      } else {
        encoded += fmt::format("%{:02X}", byte);
      }
    }
    return encoded;
  }

  auto parse_query(std::string_view query) -> std::map<std::string, std::string>
  {
    std::map<std::string, std::string> parameters;
    while (not query.empty()) {
      const auto separator = query.find('&');
      const auto pair = query.substr(0, separator);
      query = separator == std::string_view::npos ? std::string_view{} : query.substr(separator + 1);
      if (pair.empty()) { continue; }

      const auto equals = pair.find('=');
      auto key = percent_decode(pair.substr(0, equals));
      auto value = equals == std::string_view::npos ? std::string{} : percent_decode(pair.substr(equals + 1));
      parameters.try_emplace(std::move(key), std::move(value));
    }
    return parameters;
  }

  auto valid_authority(std::string_view authority) -> bool
  {
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) { authority.remove_prefix(at + 1); }

    std::string_view port;
    if (authority.starts_with('[')) {
      const auto close = authority.find(']');
      if (close == std::string_view::npos or close == 1) { return false; }
      const auto after = authority.substr(close + 1);
      if (not after.empty() and not after.starts_with(':')) { return false; }
      if (not after.empty()) { port = after.substr(1); }
    } else {
      const auto colon = authority.find(':');
      if (colon == 0) { return false; }
      if (colon != std::string_view::npos) { port = authority.substr(colon + 1); }
      if (colon != std::string_view::npos and port.empty()) { return false; }
    }

    return std::all_of(port.begin(), port.end(), [](unsigned char character) { return std::isdigit(character) != 0; });
  }

  auto classify(std::string_view kind_name) -> pairing_kind
  {
    const auto name = lowercase(kind_name);
    if (name == "direct" or name == "local") { return pairing_kind::direct; }
    if (name == "relay" or name == "cloudflare") { return pairing_kind::relay; }
    if (name == "mesh" or name == "tailscale") { return pairing_kind::mesh; }
    return pairing_kind::unsupported;
  }
}// namespace

auto pairing_descriptor::transport() const -> std::optional<core::transport_kind>
{
  switch (kind) {
  case pairing_kind::direct:
    return core::transport_kind::direct_pinned;
  case pairing_kind::relay:
    return core::transport_kind::relay_gateway;
  case pairing_kind::mesh:
    return fingerprint ? core::transport_kind::mesh_pinned : core::transport_kind::mesh_trusted;
  case pairing_kind::unsupported:
    break;
  }
  return std::nullopt;
}

auto pairing_descriptor::websocket_url() const -> std::string
{
  if (base_url.starts_with("https://")) { return "wss://" + base_url.substr(8); }// NOLINT(cppcoreguidelines-avoid-magic-numbers)
  if (base_url.starts_with("http://")) { return "ws://" + base_url.substr(7); }// NOLINT(cppcoreguidelines-avoid-magic-numbers)
  return base_url;
}

auto pairing_descriptor::description() const -> std::string
{
  if (const auto kind_of_transport = transport()) { return std::string(core::display_name(*kind_of_transport)); }
  return fmt::format("Unsupported ({})", kind_name);
}

auto pairing_descriptor::to_url() const -> std::string
{
  auto url = fmt::format("{}{}{}?code={}", base_url, pair_prefix, kind_name, percent_encode(code));
  if (fingerprint) { url += "&fp=" + percent_encode(*fingerprint); }
  return url;
}

auto parse_pairing_url(std::string_view input) -> pairing_descriptor
{
  const auto url = trim(input);

  const auto scheme_end = url.find("://");
  if (url.empty() or scheme_end == std::string_view::npos or scheme_end == 0) {
    throw pairing_error::invalid_url("Could not parse URL");
  }

  const auto scheme = lowercase(url.substr(0, scheme_end));
  if (scheme != "http" and scheme != "https") { throw pairing_error::invalid_url("URL must use http:// or https://"); }

  const auto rest = url.substr(scheme_end + 3);
  const auto authority_end = rest.find_first_of("/?#");
  const auto authority = rest.substr(0, authority_end);
  if (authority.empty()) { throw pairing_error::invalid_url("Missing host"); }
  if (not valid_authority(authority)) { throw pairing_error::invalid_url("Malformed host or port"); }

  auto remainder = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);
  remainder = remainder.substr(0, remainder.find('#'));
  const auto query_start = remainder.find('?');
  const auto path = remainder.substr(0, query_start);
  const auto query = query_start == std::string_view::npos ? std::string_view{} : remainder.substr(query_start + 1);

  if (not path.starts_with(pair_prefix)) { throw pairing_error::invalid_url("Not a pairing URL (expected /pair/<type>)"); }

  auto kind_name = path.substr(pair_prefix.size());
  while (kind_name.ends_with('/')) { kind_name.remove_suffix(1); }
  if (kind_name.empty()) { throw pairing_error::invalid_url("Missing pairing type"); }

  auto parameters = parse_query(query);

  const auto code = parameters.find("code");
  if (code == parameters.end() or code->second.empty()) { throw pairing_error::missing_code(); }

  pairing_descriptor descriptor;
  descriptor.kind = classify(kind_name);
  descriptor.kind_name = std::string(kind_name);
  descriptor.code = code->second;
  if (const auto fingerprint = parameters.find("fp"); fingerprint != parameters.end() and not fingerprint->second.empty()) {
    descriptor.fingerprint = fingerprint->second;
  }
  descriptor.full_url = std::string(url);
  descriptor.base_url = scheme + "://" + std::string(authority);
  return descriptor;
}

}// namespace tether::pairing
