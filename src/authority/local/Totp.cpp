#include "lockwarden/authority/local/Totp.hpp"

#include "lockwarden/security/ScopeWipe.hpp"
#include "lockwarden/security/SecureEquals.hpp"
#include <array>
#include <cctype>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <stdexcept>

namespace lockwarden::authority::local
{
namespace
{

constexpr std::string_view g_kBase32Alphabet{ "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567" };
constexpr std::size_t g_kSha1Bytes{ 20U };
constexpr std::uint32_t g_kMaxDigits{ 9U };

using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

[[nodiscard]] std::array<std::uint8_t, g_kSha1Bytes> hmacSha1(std::span<const std::uint8_t> key,
                                                              std::span<const std::uint8_t> message)
{
    EvpMacPtr mac{ EVP_MAC_fetch(nullptr, "HMAC", nullptr), &EVP_MAC_free };
    if (!mac)
    {
        throw std::runtime_error("hmacSha1: OpenSSL HMAC not available");
    }

    EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(mac.get()), &EVP_MAC_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("hmacSha1: EVP_MAC_CTX_new failed");
    }

    // OSSL_PARAM takes a non-const pointer even for read-only strings.
    std::array<char, 5> digest{ 'S', 'H', 'A', '1', '\0' };
    OSSL_PARAM params[]{
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest.data(), 0),
        OSSL_PARAM_construct_end(),
    };

    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1)
    {
        throw std::runtime_error("hmacSha1: EVP_MAC_init failed");
    }
    if (EVP_MAC_update(ctx.get(), message.data(), message.size()) != 1)
    {
        throw std::runtime_error("hmacSha1: EVP_MAC_update failed");
    }

    std::array<std::uint8_t, g_kSha1Bytes> out{};
    std::size_t written{ out.size() };
    if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1 || written != out.size())
    {
        throw std::runtime_error("hmacSha1: EVP_MAC_final failed");
    }
    return out;
}

[[nodiscard]] int base32Value(char c) noexcept
{
    const auto upper{ static_cast<char>(std::toupper(static_cast<unsigned char>(c))) };
    const auto pos{ g_kBase32Alphabet.find(upper) };
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

} // namespace

std::string base32Encode(std::span<const std::uint8_t> bytes)
{
    std::string out{};
    out.reserve((bytes.size() * 8U + 4U) / 5U);

    std::uint32_t buffer{ 0U };
    std::uint32_t bits{ 0U };
    for (const std::uint8_t b : bytes)
    {
        buffer = (buffer << 8U) | b;
        bits += 8U;
        while (bits >= 5U)
        {
            out.push_back(g_kBase32Alphabet[(buffer >> (bits - 5U)) & 0x1FU]);
            bits -= 5U;
        }
    }
    if (bits > 0U)
    {
        out.push_back(g_kBase32Alphabet[(buffer << (5U - bits)) & 0x1FU]);
    }
    return out;
}

std::optional<lockwarden::security::SecureBuffer> base32Decode(std::string_view text)
{
    lockwarden::security::SecureBuffer out{};
    out.reserve(text.size() * 5U / 8U);

    std::uint32_t buffer{ 0U };
    std::uint32_t bits{ 0U };
    for (const char c : text)
    {
        if (c == '=' || c == ' ')
        {
            continue;
        }
        const int value{ base32Value(c) };
        if (value < 0)
        {
            return std::nullopt;
        }
        buffer = (buffer << 5U) | static_cast<std::uint32_t>(value);
        bits += 5U;
        if (bits >= 8U)
        {
            out.push_back(static_cast<std::uint8_t>((buffer >> (bits - 8U)) & 0xFFU));
            bits -= 8U;
        }
    }
    return out;
}

std::string computeHotp(std::span<const std::uint8_t> key, std::uint64_t counter, std::uint32_t digits)
{
    if (key.empty())
    {
        throw std::invalid_argument("computeHotp: empty key");
    }
    if (digits == 0U || digits > g_kMaxDigits)
    {
        throw std::invalid_argument("computeHotp: unsupported digit count");
    }

    std::array<std::uint8_t, 8> message{};
    for (std::size_t i = 0; i < message.size(); ++i)
    {
        message[message.size() - 1U - i] = static_cast<std::uint8_t>((counter >> (8U * i)) & 0xFFU);
    }

    auto mac{ hmacSha1(key, message) };
    auto wipeMac{ lockwarden::security::scopeWipe(std::span<std::uint8_t>{ mac }) };

    const std::size_t offset{ static_cast<std::size_t>(mac[mac.size() - 1U] & 0x0FU) };
    const std::uint32_t binary{ (static_cast<std::uint32_t>(mac[offset] & 0x7FU) << 24U) |
                                (static_cast<std::uint32_t>(mac[offset + 1U]) << 16U) |
                                (static_cast<std::uint32_t>(mac[offset + 2U]) << 8U) |
                                static_cast<std::uint32_t>(mac[offset + 3U]) };

    std::uint32_t modulus{ 1U };
    for (std::uint32_t i = 0; i < digits; ++i)
    {
        modulus *= 10U;
    }

    std::string code{ std::to_string(binary % modulus) };
    if (code.size() < digits)
    {
        code.insert(0, digits - code.size(), '0');
    }
    return code;
}

std::string computeTotp(std::span<const std::uint8_t> key, std::uint64_t unixSeconds, std::uint32_t digits,
                        std::uint64_t stepSeconds)
{
    if (stepSeconds == 0U)
    {
        throw std::invalid_argument("computeTotp: zero step");
    }
    return computeHotp(key, unixSeconds / stepSeconds, digits);
}

bool verifyTotp(std::span<const std::uint8_t> key, std::string_view code, std::uint64_t unixSeconds,
                std::uint64_t skewSteps)
{
    if (code.size() != g_kTotpDigits)
    {
        return false;
    }

    const std::uint64_t current{ unixSeconds / g_kTotpStepSeconds };
    const std::uint64_t first{ current >= skewSteps ? current - skewSteps : 0U };
    bool matched{ false };
    for (std::uint64_t counter = first; counter <= current + skewSteps; ++counter)
    {
        std::string expected{ computeHotp(key, counter) };
        auto wipeExpected{ lockwarden::security::scopeWipe(expected) };
        matched = lockwarden::security::secureEquals(expected, code) || matched;
    }
    return matched;
}

std::string provisioningUri(std::string_view issuer, std::string_view account, std::string_view base32Secret)
{
    std::string uri{ "otpauth://totp/" };
    uri.append(issuer);
    uri.push_back(':');
    uri.append(account);
    uri.append("?secret=");
    uri.append(base32Secret);
    uri.append("&issuer=");
    uri.append(issuer);
    uri.append("&algorithm=SHA1&digits=");
    uri.append(std::to_string(g_kTotpDigits));
    uri.append("&period=");
    uri.append(std::to_string(g_kTotpStepSeconds));
    return uri;
}

} // namespace lockwarden::authority::local
