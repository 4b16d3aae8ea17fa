#include "lockwarden/core/HexCodec.hpp"

namespace lockwarden::core
{
namespace
{

constexpr std::uint8_t g_kNibbleShift{ 4U };
constexpr std::uint8_t g_kNibbleMask{ 0x0FU };
constexpr int g_kInvalidNibble{ -1 };

[[nodiscard]] constexpr int nibbleOf(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return g_kInvalidNibble;
}

} // namespace

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kDigits[] = "0123456789abcdef";

    std::string out;
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kDigits[(b >> g_kNibbleShift) & g_kNibbleMask]);
        out.push_back(kDigits[b & g_kNibbleMask]);
    }
    return out;
}

bool fromHexInto(std::string_view text, std::span<std::uint8_t> out) noexcept
{
    if (text.size() != out.size() * 2U)
    {
        return false;
    }
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const int hi{ nibbleOf(text[2U * i]) };
        const int lo{ nibbleOf(text[(2U * i) + 1U]) };
        if (hi == g_kInvalidNibble || lo == g_kInvalidNibble)
        {
            return false;
        }
        out[i] = static_cast<std::uint8_t>((hi << g_kNibbleShift) | lo);
    }
    return true;
}

std::optional<std::vector<std::uint8_t>> fromHex(std::string_view text)
{
    if (text.size() % 2U != 0U)
    {
        return std::nullopt;
    }
    std::vector<std::uint8_t> out(text.size() / 2U);
    if (!fromHexInto(text, std::span<std::uint8_t>{ out }))
    {
        return std::nullopt;
    }
    return out;
}

} // namespace lockwarden::core
