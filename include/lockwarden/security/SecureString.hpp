#ifndef INCLUDE_LOCKWARDEN_SECURITY_SECURESTRING_HPP
#define INCLUDE_LOCKWARDEN_SECURITY_SECURESTRING_HPP

#include "lockwarden/security/ZeroAllocator.hpp"
#include <string_view>

namespace lockwarden::security
{

// Master secrets, entry secrets and second-factor material. Not NUL-terminated.
using SecureString = ZeroVector<char>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view text)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(text.begin(), text.end());
}

// Valid until the string is modified or released.
[[nodiscard]] inline std::string_view asStringView(const SecureString& text) noexcept
{
    return text.empty() ? std::string_view{} : std::string_view{ text.data(), text.size() };
}

} // namespace lockwarden::security

#endif // INCLUDE_LOCKWARDEN_SECURITY_SECURESTRING_HPP
