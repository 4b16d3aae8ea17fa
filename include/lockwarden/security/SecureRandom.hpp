#ifndef INCLUDE_LOCKWARDEN_SECURITY_SECURERANDOM_HPP
#define INCLUDE_LOCKWARDEN_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>
#include <string_view>

namespace lockwarden::security
{

// Kernel CSPRNG. false only when the kernel refuses; out is then unspecified.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Uniform in [0, bound). false for bound == 0.
[[nodiscard]] bool secureRandomBounded(std::uint64_t bound, std::uint64_t& out) noexcept;

// Fills out with characters drawn uniformly from alphabet. false for an empty alphabet.
[[nodiscard]] bool secureRandomString(std::string_view alphabet, std::span<char> out) noexcept;

} // namespace lockwarden::security

#endif // INCLUDE_LOCKWARDEN_SECURITY_SECURERANDOM_HPP
