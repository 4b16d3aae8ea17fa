#ifndef INCLUDE_LOCKWARDEN_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_LOCKWARDEN_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace lockwarden::security
{

// Runs in time independent of where the inputs differ. A length mismatch returns early: lengths are public.
[[nodiscard]] bool secureEquals(std::span<const std::byte> lhs, std::span<const std::byte> rhs) noexcept;

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) noexcept
{
    return secureEquals(std::as_bytes(lhs), std::as_bytes(rhs));
}

// Typed one-time codes and recovery codes.
[[nodiscard]] inline bool secureEquals(std::string_view lhs, std::string_view rhs) noexcept
{
    return secureEquals(std::as_bytes(std::span<const char>{ lhs.data(), lhs.size() }),
                        std::as_bytes(std::span<const char>{ rhs.data(), rhs.size() }));
}

} // namespace lockwarden::security

#endif // INCLUDE_LOCKWARDEN_SECURITY_SECUREEQUALS_HPP
