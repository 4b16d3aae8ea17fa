#include "lockwarden/security/SecureEquals.hpp"

namespace lockwarden::security
{

bool secureEquals(std::span<const std::byte> lhs, std::span<const std::byte> rhs) noexcept
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }

    // volatile keeps the loop from being cut short once a difference is seen.
    volatile std::uint32_t acc{ 0U };
    for (std::size_t i{}; i < lhs.size(); ++i)
    {
        acc = acc | std::to_integer<std::uint32_t>(lhs[i] ^ rhs[i]);
    }
    // acc is at most 0xFF: acc - 1 wraps to the top bit only when acc is zero.
    const std::uint32_t folded{ acc };
    return ((folded - 1U) >> 31U) == 1U;
}

} // namespace lockwarden::security
