#ifndef INCLUDE_LOCKWARDEN_SECURITY_PASSWORDGENERATOR_HPP
#define INCLUDE_LOCKWARDEN_SECURITY_PASSWORDGENERATOR_HPP

#include "lockwarden/security/SecureString.hpp"
#include <cstddef>
#include <optional>
#include <string_view>

namespace lockwarden::security
{

inline constexpr std::string_view g_kLowerCharacters{ "abcdefghijklmnopqrstuvwxyz" };
inline constexpr std::string_view g_kUpperCharacters{ "ABCDEFGHIJKLMNOPQRSTUVWXYZ" };
inline constexpr std::string_view g_kDigitCharacters{ "0123456789" };
inline constexpr std::string_view g_kSymbolCharacters{ "!@#$%^&*(),.?\":{}|<>" };

inline constexpr std::size_t g_kDefaultPasswordLength{ 16 };
inline constexpr std::size_t g_kMaxPasswordLength{ 4096 };

struct PasswordOptions final
{
    std::size_t length{ g_kDefaultPasswordLength };
    bool lower{ true };
    bool upper{ true };
    bool digits{ true };
    bool symbols{ true };
};

// Random password drawn from the enabled character classes, containing at least one character of each
// enabled class when the length allows it. Length is clamped to [1, g_kMaxPasswordLength]; with fewer
// positions than enabled classes, that many of the classes are represented. No class enabled yields an
// empty password.
// std::nullopt only when the kernel CSPRNG fails.
[[nodiscard]] std::optional<SecureString> generatePassword(const PasswordOptions& options = {});

} // namespace lockwarden::security

#endif // INCLUDE_LOCKWARDEN_SECURITY_PASSWORDGENERATOR_HPP
