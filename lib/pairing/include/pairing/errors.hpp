#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tether::pairing {

enum class error_kind : std::uint8_t {
  invalid_url,
  missing_code,
  missing_fingerprint,
  invalid_code,
  rate_limited,
  fingerprint_mismatch,
  network,
  invalid_response,
  unsupported_kind,
};

[[nodiscard]] auto to_string(error_kind kind) -> std::string_view;

/**
 * @brief Any failure while parsing a pairing URL or exchanging its code.
 *
 * what() is the user-facing message. None of these are retried automatically.
 */
class pairing_error : public std::runtime_error
{
public:
  pairing_error(error_kind kind, const std::string &message);

  [[nodiscard]] static auto invalid_url(std::string_view reason) -> pairing_error;
  [[nodiscard]] static auto missing_code() -> pairing_error;
  [[nodiscard]] static auto missing_fingerprint() -> pairing_error;
  [[nodiscard]] static auto invalid_code() -> pairing_error;
  [[nodiscard]] static auto rate_limited() -> pairing_error;
  [[nodiscard]] static auto fingerprint_mismatch(const std::string &expected, const std::string &received)
    -> pairing_error;
  [[nodiscard]] static auto network(std::string_view reason) -> pairing_error;
  [[nodiscard]] static auto invalid_response(std::string_view reason) -> pairing_error;
  [[nodiscard]] static auto unsupported_kind(std::string_view kind) -> pairing_error;

  [[nodiscard]] auto kind() const -> error_kind { return kind_; }

  /// Set only for fingerprint_mismatch.
  [[nodiscard]] auto expected_fingerprint() const -> const std::optional<std::string> & { return expected_; }
  [[nodiscard]] auto received_fingerprint() const -> const std::optional<std::string> & { return received_; }

private:
  error_kind kind_;
  std::optional<std::string> expected_;
  std::optional<std::string> received_;
};

}// namespace tether::pairing
