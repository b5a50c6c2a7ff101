#pragma once

#include <boost/asio/ssl/verify_context.hpp>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tether::security {

/// Algorithm prefix carried by formatted fingerprints.
inline constexpr std::string_view fingerprint_prefix = "SHA256:";

/**
 * @brief Formats a digest as "SHA256:" followed by colon-separated uppercase hex pairs.
 */
[[nodiscard]] auto format_fingerprint(std::span<const std::uint8_t> digest) -> std::string;

/**
 * @brief SHA-256 fingerprint of a DER-encoded certificate.
 *
 * @throws std::runtime_error if the digest cannot be computed
 */
[[nodiscard]] auto compute_fingerprint(std::span<const std::byte> der_certificate) -> std::string;

/**
 * @brief Canonical comparison form: algorithm prefix stripped (any case), hex uppercased, whitespace dropped.
 */
[[nodiscard]] auto normalize_fingerprint(std::string_view fingerprint) -> std::string;

/// "SHA256:AB:CD" matches "ab:cd".
[[nodiscard]] auto fingerprints_match(std::string_view lhs, std::string_view rhs) -> bool;

/**
 * @brief Raised when a pinned peer presents a certificate with an unexpected fingerprint.
 *
 * Kept distinct from connectivity errors: it is never retried.
 */
class fingerprint_mismatch : public std::runtime_error
{
public:
  fingerprint_mismatch(std::string expected, std::string received);

  [[nodiscard]] auto expected() const -> const std::string & { return expected_; }
  [[nodiscard]] auto received() const -> const std::string & { return received_; }

private:
  std::string expected_;
  std::string received_;
};

/**
 * @brief Trust decision for a self-signed peer: accept exactly the expected leaf certificate.
 *
 * The fingerprint of the last leaf certificate seen is recorded even when it is rejected, so a
 * failed handshake can be reported as a mismatch naming both values.
 */
class fingerprint_validator
{
public:
  explicit fingerprint_validator(std::string expected_fingerprint);

  /**
   * @brief Records the received fingerprint and compares it with the expected one.
   */
  auto check(std::string_view received_fingerprint) -> bool;

  /// Fingerprints the DER certificate and checks it.
  auto check_certificate(std::span<const std::byte> der_certificate) -> bool;

  /**
   * @brief OpenSSL verify callback body.
   *
   * Chain validation is skipped; the leaf at depth 0 alone decides.
   */
  auto verify(bool preverified, boost::asio::ssl::verify_context &context) -> bool;

  [[nodiscard]] auto expected() const -> const std::string & { return expected_; }
  [[nodiscard]] auto received() const -> std::optional<std::string>;

  /// True once a certificate has been seen that does not match.
  [[nodiscard]] auto mismatch_detected() const -> bool;

  [[nodiscard]] auto mismatch_error() const -> fingerprint_mismatch;

private:
  std::string expected_;
  mutable std::mutex mutex_;
  std::optional<std::string> received_;
};

}// namespace tether::security
