#include "lockwarden/authority/local/LocalAuthorityFactory.hpp"

#include "AccountStore.hpp"
#include "lockwarden/authority/local/Totp.hpp"
#include "lockwarden/core/HexCodec.hpp"
#include "lockwarden/core/VaultCipher.hpp"
#include "lockwarden/crypto/KdfParams.hpp"
#include "lockwarden/log/Log.hpp"
#include "lockwarden/security/MemoryWiper.hpp"
#include "lockwarden/security/ScopeWipe.hpp"
#include "lockwarden/security/SecureEquals.hpp"
#include "lockwarden/security/SecureRandom.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lockwarden::authority::local
{
namespace
{

using Json = nlohmann::json;
using lockwarden::net::HttpMethod;
using lockwarden::net::HttpRequest;
using lockwarden::net::HttpResponse;

constexpr std::size_t g_kTokenBytes{ 32U };
constexpr std::size_t g_kRecoveryCodeCount{ 8U };
constexpr std::size_t g_kRecoveryCodeGroup{ 4U };
// No 0/O, 1/I/L: the codes are read off paper.
constexpr std::string_view g_kRecoveryCodeAlphabet{ "ABCDEFGHJKMNPQRSTUVWXYZ23456789" };

[[nodiscard]] HttpResponse reply(int status, const Json& body)
{
    HttpResponse out{};
    out.status = status;
    out.body = body.dump();
    out.headers.emplace("content-type", "application/json");
    return out;
}

[[nodiscard]] HttpResponse detail(int status, std::string_view message)
{
    return reply(status, Json{ { "detail", std::string{ message } } });
}

[[nodiscard]] HttpResponse invalidBody()
{
    return detail(422, "Invalid request body");
}

[[nodiscard]] std::optional<std::string> percentDecode(std::string_view text)
{
    std::string out{};
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] != '%')
        {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2U >= text.size())
        {
            return std::nullopt;
        }
        std::array<std::uint8_t, 1> decoded{};
        if (!lockwarden::core::fromHexInto(text.substr(i + 1U, 2U), decoded))
        {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(decoded[0]));
        i += 2U;
    }
    return out;
}

[[nodiscard]] std::optional<std::string> stringField(const Json& doc, const char* key)
{
    const auto it{ doc.find(key) };
    if (it == doc.end() || !it->is_string())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

struct FailureState final
{
    std::uint32_t count{ 0U };
    std::uint64_t lastFailure{ 0U };
    std::uint64_t blockedUntil{ 0U };
};

struct TokenGrant final
{
    std::string username;
    // Issued by a plain login to an account with a second factor; cannot touch the vault.
    bool restricted{ false };
};

class LocalAuthority final : public lockwarden::net::ITransport
{
public:
    explicit LocalAuthority(LocalAuthorityConfig config)
        : m_config(std::move(config)), m_store(m_config.databasePath)
    {
        if (m_config.maxFailedAttempts == 0U)
        {
            throw std::invalid_argument("LocalAuthority: maxFailedAttempts must be positive");
        }
    }

    [[nodiscard]] HttpResponse send(const HttpRequest& request) override
    {
        const std::string_view url{ request.url };
        if (url.substr(0, m_config.baseUrl.size()) != m_config.baseUrl)
        {
            throw lockwarden::net::TransportError("local authority: unknown host in " + request.url);
        }
        const std::string_view path{ url.substr(m_config.baseUrl.size()) };

        const std::lock_guard<std::mutex> guard{ m_mutex };
        try
        {
            return dispatch(request, path);
        }
        catch (const std::runtime_error& e)
        {
            lockwarden::log::error("local authority: ", e.what());
            return detail(500, "Internal Server Error");
        }
    }

private:
    LocalAuthorityConfig m_config;
    std::mutex m_mutex;
    AccountStore m_store;
    std::map<std::string, FailureState, std::less<>> m_failures;
    std::map<std::string, TokenGrant, std::less<>> m_tokens;

    [[nodiscard]] std::uint64_t now() const
    {
        if (m_config.clock)
        {
            return m_config.clock();
        }
        const auto since{ std::chrono::system_clock::now().time_since_epoch() };
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(since).count());
    }

    [[nodiscard]] HttpResponse dispatch(const HttpRequest& request, std::string_view path)
    {
        constexpr std::string_view kSaltPrefix{ "/auth_salt/" };
        constexpr std::string_view kMfaStatusPrefix{ "/mfa/status/" };

        if (request.method == HttpMethod::Get)
        {
            if (path.starts_with(kSaltPrefix))
            {
                return authSalt(path.substr(kSaltPrefix.size()));
            }
            if (path.starts_with(kMfaStatusPrefix))
            {
                return mfaStatus(path.substr(kMfaStatusPrefix.size()));
            }
            if (path == "/vault")
            {
                return getVault(request.authorization);
            }
            return detail(404, "Not Found");
        }

        if (path == "/vault")
        {
            return putVault(request.authorization, request.body);
        }
        if (path == "/mfa/setup")
        {
            return setupSecondFactor(request.authorization);
        }
        if (path == "/mfa/disable")
        {
            return disableSecondFactor(request.authorization);
        }

        auto doc{ Json::parse(request.body, nullptr, false) };
        if (doc.is_discarded() || !doc.is_object())
        {
            return invalidBody();
        }
        if (path == "/register")
        {
            return registerAccount(doc);
        }
        if (path == "/login")
        {
            return login(doc, false);
        }
        if (path == "/login/mfa")
        {
            return login(doc, true);
        }
        if (path == "/mfa/verify")
        {
            return verifySecondFactor(doc);
        }
        return detail(404, "Not Found");
    }

    [[nodiscard]] HttpResponse authSalt(std::string_view encodedUsername) const
    {
        const auto username{ percentDecode(encodedUsername) };
        if (!username)
        {
            return detail(404, "User not found");
        }
        const auto account{ m_store.find(*username) };
        if (!account)
        {
            return detail(404, "User not found");
        }
        return reply(200, Json{ { "salt", lockwarden::core::toHex(account->salt) } });
    }

    [[nodiscard]] HttpResponse mfaStatus(std::string_view encodedUsername) const
    {
        const auto username{ percentDecode(encodedUsername) };
        const auto account{ username ? m_store.find(*username) : std::nullopt };
        if (!account)
        {
            return detail(404, "User not found");
        }
        return reply(200, Json{ { "mfa_enabled", account->mfaEnabled } });
    }

    [[nodiscard]] HttpResponse registerAccount(const Json& doc)
    {
        const auto username{ stringField(doc, "username") };
        const auto saltHex{ stringField(doc, "salt") };
        const auto verifierHex{ stringField(doc, "verifier") };
        if (!username || username->empty() || !saltHex || !verifierHex)
        {
            return invalidBody();
        }

        std::array<std::uint8_t, lockwarden::crypto::g_argon2SaltBytes> salt{};
        std::array<std::uint8_t, lockwarden::crypto::g_derivedKeyBytes> verifier{};
        if (!lockwarden::core::fromHexInto(*saltHex, salt) || !lockwarden::core::fromHexInto(*verifierHex, verifier))
        {
            return invalidBody();
        }

        if (!m_store.create(*username, salt, verifier))
        {
            return detail(400, "Username already registered");
        }
        lockwarden::log::info("local authority: registered ", *username);
        return reply(201, Json{ { "message", "User registered" } });
    }

    [[nodiscard]] std::optional<HttpResponse> throttled(std::string_view username)
    {
        const auto it{ m_failures.find(username) };
        if (it == m_failures.end() || it->second.blockedUntil == 0U)
        {
            return std::nullopt;
        }

        const std::uint64_t current{ now() };
        if (it->second.blockedUntil <= current)
        {
            m_failures.erase(it);
            return std::nullopt;
        }

        const std::uint64_t wait{ it->second.blockedUntil - current };
        auto response{ detail(429, "Too many failed attempts. Try again in " + std::to_string(wait) + " seconds.") };
        response.headers["retry-after"] = std::to_string(wait);
        return response;
    }

    void recordFailure(std::string_view username)
    {
        const std::uint64_t current{ now() };
        const auto window{ static_cast<std::uint64_t>(m_config.failureWindow.count()) };

        // Entries that can neither throttle nor accumulate any more.
        std::erase_if(m_failures,
                      [current, window](const auto& entry)
                      {
                          return current > entry.second.lastFailure + window && entry.second.blockedUntil <= current;
                      });

        auto it{ m_failures.find(username) };
        if (it == m_failures.end())
        {
            it = m_failures.emplace(std::string{ username }, FailureState{}).first;
        }

        auto& state{ it->second };
        if (state.count > 0U && current - state.lastFailure > window)
        {
            state = FailureState{};
        }
        ++state.count;
        state.lastFailure = current;
        if (state.count >= m_config.maxFailedAttempts)
        {
            state.blockedUntil = current + static_cast<std::uint64_t>(m_config.retryAfter.count());
            lockwarden::log::warning("local authority: throttling ", username);
        }
    }

    [[nodiscard]] bool codeAccepted(const AccountRecord& account, std::string_view code)
    {
        if (!account.mfaSecret)
        {
            return false;
        }
        const auto key{ base32Decode(*account.mfaSecret) };
        if (!key)
        {
            return false;
        }
        if (verifyTotp(std::span<const std::uint8_t>{ *key }, code, now()))
        {
            return true;
        }
        return m_store.consumeRecoveryCode(account.username, code);
    }

    [[nodiscard]] HttpResponse login(const Json& doc, bool withSecondFactor)
    {
        const auto username{ stringField(doc, "username") };
        auto verifierHex{ stringField(doc, "verifier") };
        if (!username || !verifierHex)
        {
            return invalidBody();
        }
        auto wipeVerifierHex{ lockwarden::security::scopeWipe(*verifierHex) };

        if (auto limited{ throttled(*username) })
        {
            return std::move(*limited);
        }

        const auto account{ m_store.find(*username) };
        std::array<std::uint8_t, lockwarden::crypto::g_derivedKeyBytes> verifier{};
        auto wipeVerifier{ lockwarden::security::scopeWipe(std::span<std::uint8_t>{ verifier }) };
        if (!account || !lockwarden::core::fromHexInto(*verifierHex, verifier) ||
            !lockwarden::security::secureEquals(std::span<const std::uint8_t>{ account->verifier },
                                                std::span<const std::uint8_t>{ verifier }))
        {
            recordFailure(*username);
            return detail(401, "Invalid credentials");
        }

        if (withSecondFactor)
        {
            auto code{ stringField(doc, "mfa_code") };
            if (!code)
            {
                return invalidBody();
            }
            auto wipeCode{ lockwarden::security::scopeWipe(*code) };
            if (!account->mfaEnabled)
            {
                return detail(400, "MFA is not enabled");
            }
            if (!codeAccepted(*account, *code))
            {
                recordFailure(*username);
                return detail(401, "Invalid MFA code");
            }
        }

        m_failures.erase(*username);
        const bool restricted{ account->mfaEnabled && !withSecondFactor };
        return reply(200, Json{ { "token", issueToken(*username, restricted) } });
    }

    [[nodiscard]] std::string issueToken(std::string_view username, bool restricted)
    {
        std::array<std::uint8_t, g_kTokenBytes> raw{};
        if (!lockwarden::security::secureRandomFill(raw))
        {
            throw std::runtime_error("local authority: CSPRNG failure");
        }
        auto token{ lockwarden::core::toHex(raw) };
        m_tokens[token] = TokenGrant{ std::string{ username }, restricted };
        return token;
    }

    // std::nullopt for unknown tokens and for restricted ones unless allowed.
    [[nodiscard]] std::optional<TokenGrant> grantFor(std::string_view token) const
    {
        const auto it{ m_tokens.find(token) };
        if (token.empty() || it == m_tokens.end() || it->second.restricted)
        {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] HttpResponse setupSecondFactor(std::string_view token)
    {
        const auto grant{ grantFor(token) };
        if (!grant)
        {
            return detail(401, "Not authenticated");
        }

        std::array<std::uint8_t, g_kTotpSecretBytes> key{};
        auto wipeKey{ lockwarden::security::scopeWipe(std::span<std::uint8_t>{ key }) };
        if (!lockwarden::security::secureRandomFill(key))
        {
            throw std::runtime_error("local authority: CSPRNG failure");
        }
        std::string secret{ base32Encode(key) };
        auto wipeSecret{ lockwarden::security::scopeWipe(secret) };

        std::vector<std::string> codes{};
        for (std::size_t i = 0; i < g_kRecoveryCodeCount; ++i)
        {
            std::string code(2U * g_kRecoveryCodeGroup + 1U, '-');
            const std::span<char> chars{ code };
            const auto head{ chars.first(g_kRecoveryCodeGroup) };
            const auto tail{ chars.last(g_kRecoveryCodeGroup) };
            if (!lockwarden::security::secureRandomString(g_kRecoveryCodeAlphabet, head) ||
                !lockwarden::security::secureRandomString(g_kRecoveryCodeAlphabet, tail))
            {
                throw std::runtime_error("local authority: CSPRNG failure");
            }
            codes.push_back(std::move(code));
        }

        m_store.beginSecondFactor(grant->username, secret, codes);
        const auto uri{ provisioningUri(m_config.issuer, grant->username, secret) };
        lockwarden::log::info("local authority: second factor enrollment started for ", grant->username);

        Json body{
            { "secret", secret },
            { "provisioning_uri", uri },
            { "qr_code", uri },
            { "backup_codes", codes },
        };
        auto response{ reply(200, body) };
        auto wipeBodySecret{ lockwarden::security::scopeWipe(body["secret"].get_ref<std::string&>()) };
        for (auto& code : codes)
        {
            lockwarden::security::secureWipe(code);
        }
        return response;
    }

    [[nodiscard]] HttpResponse verifySecondFactor(const Json& doc)
    {
        const auto username{ stringField(doc, "username") };
        auto code{ stringField(doc, "code") };
        if (!username || !code)
        {
            return invalidBody();
        }
        auto wipeCode{ lockwarden::security::scopeWipe(*code) };

        if (auto limited{ throttled(*username) })
        {
            return std::move(*limited);
        }

        const auto account{ m_store.find(*username) };
        if (!account || !account->mfaSecret)
        {
            return detail(400, "MFA setup not started");
        }
        const auto key{ base32Decode(*account->mfaSecret) };
        if (!key || !verifyTotp(std::span<const std::uint8_t>{ *key }, *code, now()))
        {
            recordFailure(*username);
            return detail(400, "Invalid code");
        }

        m_store.enableSecondFactor(*username);
        lockwarden::log::info("local authority: second factor enabled for ", *username);
        return reply(200, Json{ { "message", "MFA enabled" } });
    }

    [[nodiscard]] HttpResponse disableSecondFactor(std::string_view token)
    {
        const auto grant{ grantFor(token) };
        if (!grant)
        {
            return detail(401, "Not authenticated");
        }
        m_store.disableSecondFactor(grant->username);
        lockwarden::log::info("local authority: second factor disabled for ", grant->username);
        return reply(200, Json{ { "message", "MFA disabled" } });
    }

    [[nodiscard]] HttpResponse getVault(std::string_view token) const
    {
        const auto grant{ grantFor(token) };
        if (!grant)
        {
            return detail(401, "Not authenticated");
        }
        const auto account{ m_store.find(grant->username) };
        if (!account)
        {
            return detail(401, "Not authenticated");
        }

        Json body{ { "blob", nullptr } };
        if (account->vault)
        {
            body["blob"] = Json::parse(*account->vault);
        }
        return reply(200, body);
    }

    [[nodiscard]] HttpResponse putVault(std::string_view token, std::string_view requestBody)
    {
        const auto grant{ grantFor(token) };
        if (!grant)
        {
            return detail(401, "Not authenticated");
        }

        const auto doc{ Json::parse(requestBody, nullptr, false) };
        if (doc.is_discarded() || !doc.is_object() || !doc.contains("blob") || !doc["blob"].is_object())
        {
            return invalidBody();
        }
        const auto blob{ doc["blob"].dump() };
        if (!lockwarden::core::decodeSealedVault(blob))
        {
            return invalidBody();
        }

        m_store.storeVault(grant->username, blob);
        lockwarden::log::debug("local authority: vault stored for ", grant->username);
        return reply(200, Json{ { "message", "Vault updated" } });
    }
};

} // namespace

std::unique_ptr<lockwarden::net::ITransport> makeLocalAuthority(LocalAuthorityConfig config)
{
    return std::make_unique<LocalAuthority>(std::move(config));
}

} // namespace lockwarden::authority::local
