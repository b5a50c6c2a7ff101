#include <security/fingerprint.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace tether::security {

namespace {
  auto starts_with_prefix(std::string_view value) -> bool
  {
    if (value.size() < fingerprint_prefix.size()) { return false; }
    return std::equal(fingerprint_prefix.begin(), fingerprint_prefix.end(), value.begin(), [](char lhs, char rhs) {
      return std::toupper(static_cast<unsigned char>(lhs)) == std::toupper(static_cast<unsigned char>(rhs));
    });
  }
}// namespace

auto format_fingerprint(std::span<const std::uint8_t> digest) -> std::string
{
  std::string hex;
  for (const auto byte : digest) {
    if (not hex.empty()) { hex += ':'; }
    hex += fmt::format("{:02X}", byte);
  }
  return std::string(fingerprint_prefix) + hex;
}

auto compute_fingerprint(std::span<const std::byte> der_certificate) -> std::string
{
  std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_length = 0;

  if (EVP_Digest(der_certificate.data(),
        der_certificate.size(),
        digest.data(),
        &digest_length,
        EVP_sha256(),
        nullptr)
      != 1) {
    throw std::runtime_error("Failed to compute certificate digest");
  }

  return format_fingerprint(std::span<const std::uint8_t>(digest.data(), digest_length));
}

auto normalize_fingerprint(std::string_view fingerprint) -> std::string
{
  if (starts_with_prefix(fingerprint)) { fingerprint.remove_prefix(fingerprint_prefix.size()); }

  std::string normalized;
  normalized.reserve(fingerprint.size());
  for (const auto character : fingerprint) {
    if (std::isspace(static_cast<unsigned char>(character)) != 0) { continue; }
    normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(character)));
  }
  return normalized;
}

auto fingerprints_match(std::string_view lhs, std::string_view rhs) -> bool
{
  return normalize_fingerprint(lhs) == normalize_fingerprint(rhs);
}

fingerprint_mismatch::fingerprint_mismatch(std::string expected, std::string received)
  : std::runtime_error(fmt::format(
      "Security warning: Certificate mismatch!\nExpected: {}\nReceived: {}\nThis may indicate a man-in-the-middle attack.",
      expected,
      received)),
    expected_(std::move(expected)), received_(std::move(received))
{}

fingerprint_validator::fingerprint_validator(std::string expected_fingerprint)
  : expected_(std::move(expected_fingerprint))
{}

auto fingerprint_validator::check(std::string_view received_fingerprint) -> bool
{
  {
    const std::scoped_lock lock(mutex_);
    received_ = std::string(received_fingerprint);
  }

  const bool matches = fingerprints_match(received_fingerprint, expected_);
  if (not matches) {
    spdlog::warn("[security] Certificate fingerprint mismatch (expected {}, received {})", expected_, received_fingerprint);
  }
  return matches;
}

auto fingerprint_validator::check_certificate(std::span<const std::byte> der_certificate) -> bool
{
  return check(compute_fingerprint(der_certificate));
}

auto fingerprint_validator::verify(bool /*preverified*/, boost::asio::ssl::verify_context &context) -> bool
{
  auto *store = context.native_handle();
  if (X509_STORE_CTX_get_error_depth(store) != 0) { return true; }

  auto *certificate = X509_STORE_CTX_get_current_cert(store);
  if (certificate == nullptr) { return false; }

  const int length = i2d_X509(certificate, nullptr);
  if (length <= 0) { return false; }

  std::vector<std::byte> der(static_cast<std::size_t>(length));
  auto *cursor = reinterpret_cast<unsigned char *>(der.data());// NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  if (i2d_X509(certificate, &cursor) != length) { return false; }

  try {
    return check_certificate(der);
  } catch (const std::runtime_error &error) {
    spdlog::error("[security] {}", error.what());
    return false;
  }
}

auto fingerprint_validator::received() const -> std::optional<std::string>
{
  const std::scoped_lock lock(mutex_);
  return received_;
}

auto fingerprint_validator::mismatch_detected() const -> bool
{
  const auto seen = received();
  return seen.has_value() and not fingerprints_match(*seen, expected_);
}

auto fingerprint_validator::mismatch_error() const -> fingerprint_mismatch
{
  return { expected_, received().value_or("(none)") };
}

}// namespace tether::security
