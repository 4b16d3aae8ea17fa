#include "lockwarden/security/SecureRandom.hpp"
#include <array>
#include <cerrno>
#include <cstddef>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace lockwarden::security
{

namespace
{

[[nodiscard]] bool randomWord(std::uint64_t& out) noexcept
{
    std::array<std::uint8_t, sizeof(std::uint64_t)> bytes{};
    if (!secureRandomFill(bytes))
    {
        return false;
    }
    std::uint64_t word{};
    for (const auto b : bytes)
    {
        word = (word << 8U) | b;
    }
    out = word;
    return true;
}

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    while (!out.empty())
    {
        const ssize_t got{ ::getrandom(out.data(), out.size(), 0) };
        if (got < 0 && errno == EINTR)
        {
            continue;
        }
        if (got <= 0 || static_cast<std::size_t>(got) > out.size())
        {
            return false;
        }
        out = out.subspan(static_cast<std::size_t>(got));
    }
    return true;
}

bool secureRandomBounded(std::uint64_t bound, std::uint64_t& out) noexcept
{
    if (bound == 0U)
    {
        return false;
    }

    // Words below 2^64 mod bound would make the low residues more likely.
    const std::uint64_t threshold{ (0U - bound) % bound };
    constexpr int kMaxDraws{ 64 };
    for (int draw{}; draw < kMaxDraws; ++draw)
    {
        std::uint64_t word{};
        if (!randomWord(word))
        {
            return false;
        }
        if (word >= threshold)
        {
            out = word % bound;
            return true;
        }
    }
    return false;
}

bool secureRandomString(std::string_view alphabet, std::span<char> out) noexcept
{
    if (alphabet.empty())
    {
        return false;
    }
    for (auto& c : out)
    {
        std::uint64_t index{};
        if (!secureRandomBounded(alphabet.size(), index))
        {
            return false;
        }
        c = alphabet[static_cast<std::size_t>(index)];
    }
    return true;
}

} // namespace lockwarden::security
