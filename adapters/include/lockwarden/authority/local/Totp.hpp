#ifndef INCLUDE_LOCKWARDEN_AUTHORITY_LOCAL_TOTP_HPP
#define INCLUDE_LOCKWARDEN_AUTHORITY_LOCAL_TOTP_HPP

#include "lockwarden/security/SecureBuffer.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace lockwarden::authority::local
{

constexpr std::uint32_t g_kTotpDigits{ 6U };
constexpr std::uint64_t g_kTotpStepSeconds{ 30U };
constexpr std::size_t g_kTotpSecretBytes{ 20U };

// RFC 4648 alphabet, upper case, no padding.
[[nodiscard]] std::string base32Encode(std::span<const std::uint8_t> bytes);

// Case-insensitive; ignores '=' padding and spaces. std::nullopt on any other non-alphabet character.
[[nodiscard]] std::optional<lockwarden::security::SecureBuffer> base32Decode(std::string_view text);

// RFC 4226 with HMAC-SHA1. Throws std::runtime_error when OpenSSL fails.
[[nodiscard]] std::string computeHotp(std::span<const std::uint8_t> key, std::uint64_t counter,
                                      std::uint32_t digits = g_kTotpDigits);

// RFC 6238 code for the step containing unixSeconds.
[[nodiscard]] std::string computeTotp(std::span<const std::uint8_t> key, std::uint64_t unixSeconds,
                                      std::uint32_t digits = g_kTotpDigits,
                                      std::uint64_t stepSeconds = g_kTotpStepSeconds);

// Accepts the current step and `skewSteps` steps either side. Comparison is constant time per candidate.
[[nodiscard]] bool verifyTotp(std::span<const std::uint8_t> key, std::string_view code, std::uint64_t unixSeconds,
                              std::uint64_t skewSteps = 1U);

// otpauth://totp/<issuer>:<account>?secret=...&issuer=...&algorithm=SHA1&digits=6&period=30
[[nodiscard]] std::string provisioningUri(std::string_view issuer, std::string_view account,
                                          std::string_view base32Secret);

} // namespace lockwarden::authority::local

#endif // INCLUDE_LOCKWARDEN_AUTHORITY_LOCAL_TOTP_HPP
