#include "lockwarden/security/PasswordGenerator.hpp"
#include "lockwarden/security/SecureRandom.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <utility>

namespace lockwarden::security
{

namespace
{

// Fisher-Yates with unbiased indices.
[[nodiscard]] bool shuffle(std::span<char> chars) noexcept
{
    for (std::size_t i{ chars.size() }; i > 1U; --i)
    {
        std::uint64_t j{};
        if (!secureRandomBounded(i, j))
        {
            return false;
        }
        std::swap(chars[i - 1U], chars[static_cast<std::size_t>(j)]);
    }
    return true;
}

} // namespace

std::optional<SecureString> generatePassword(const PasswordOptions& options)
{
    const std::array<std::pair<bool, std::string_view>, 4> classes{ {
        { options.lower, g_kLowerCharacters },
        { options.upper, g_kUpperCharacters },
        { options.digits, g_kDigitCharacters },
        { options.symbols, g_kSymbolCharacters },
    } };

    std::string alphabet;
    std::size_t enabled{};
    for (const auto& [on, characters] : classes)
    {
        if (on)
        {
            alphabet += characters;
            ++enabled;
        }
    }
    if (enabled == 0U)
    {
        return SecureString{};
    }

    const std::size_t length{ std::clamp<std::size_t>(options.length, 1U, g_kMaxPasswordLength) };
    SecureString password(std::max(length, enabled));
    std::span<char> out{ password };

    // One of each enabled class first, then the remainder from the union.
    std::size_t next{};
    for (const auto& [on, characters] : classes)
    {
        if (on && !secureRandomString(characters, out.subspan(next++, 1U)))
        {
            return std::nullopt;
        }
    }
    if (!secureRandomString(alphabet, out.subspan(enabled)) || !shuffle(out))
    {
        return std::nullopt;
    }

    // Shuffled before truncation, so a short password keeps a random subset of the classes.
    password.resize(length);
    return password;
}

} // namespace lockwarden::security
