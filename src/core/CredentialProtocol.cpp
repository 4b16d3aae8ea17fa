#include "lockwarden/core/CredentialProtocol.hpp"
#include "lockwarden/core/HexCodec.hpp"
#include "lockwarden/log/Log.hpp"
#include "lockwarden/security/ScopeWipe.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <charconv>
#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace lockwarden::core
{
namespace
{

using Json = nlohmann::json;
using lockwarden::net::HttpResponse;

constexpr int g_kHttpOk{ 200 };
constexpr int g_kHttpCreated{ 201 };
constexpr int g_kHttpBadRequest{ 400 };
constexpr int g_kHttpUnauthorized{ 401 };
constexpr int g_kHttpForbidden{ 403 };
constexpr int g_kHttpNotFound{ 404 };
constexpr int g_kHttpConflict{ 409 };
constexpr int g_kHttpTooManyRequests{ 429 };

constexpr std::chrono::seconds g_kDefaultRetryAfter{ 60 };

// Alternatives every result type carries.
using CommonFailure = std::variant<RateLimited, NetworkError, ProtocolError>;

template <class Result, class Source> [[nodiscard]] Result widen(Source&& source)
{
    return std::visit([](auto&& alt) -> Result { return Result{ std::forward<decltype(alt)>(alt) }; },
                      std::forward<Source>(source));
}

[[nodiscard]] std::string percentEncode(std::string_view text)
{
    constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (const char c : text)
    {
        const auto u{ static_cast<unsigned char>(c) };
        if (std::isalnum(u) != 0 || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(c);
            continue;
        }
        out.push_back('%');
        out.push_back(kDigits[u >> 4U]);
        out.push_back(kDigits[u & 0x0FU]);
    }
    return out;
}

[[nodiscard]] std::optional<Json> parseObject(std::string_view body)
{
    Json doc = Json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
    {
        return std::nullopt;
    }
    return doc;
}

[[nodiscard]] std::string stringOr(const Json& doc, const char* key)
{
    const auto it{ doc.find(key) };
    if (it == doc.end() || !it->is_string())
    {
        return {};
    }
    return it->get<std::string>();
}

[[nodiscard]] std::optional<std::int64_t> parseSeconds(std::string_view text) noexcept
{
    std::int64_t value{};
    const auto* first{ text.data() };
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, value) };
    if (ec != std::errc{} || ptr == first)
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<std::int64_t> firstIntegerIn(std::string_view text) noexcept
{
    const auto begin{ text.find_first_of("0123456789") };
    if (begin == std::string_view::npos)
    {
        return std::nullopt;
    }
    return parseSeconds(text.substr(begin));
}

// Wait duration: Retry-After header, then a retry_after body field, then the first number in detail.
[[nodiscard]] RateLimited rateLimitedFrom(const HttpResponse& response)
{
    RateLimited out{};
    out.detail = "Too many attempts. Try again later.";

    std::optional<std::int64_t> seconds{};
    if (const auto it{ response.headers.find("retry-after") }; it != response.headers.end())
    {
        seconds = parseSeconds(it->second);
    }

    if (const auto doc{ parseObject(response.body) })
    {
        if (const auto detail{ doc->find("detail") }; detail != doc->end() && detail->is_string())
        {
            out.detail = detail->get<std::string>();
        }
        if (const auto retry{ doc->find("retry_after") };
            !seconds && retry != doc->end() && retry->is_number_integer())
        {
            seconds = retry->get<std::int64_t>();
        }
    }

    if (!seconds)
    {
        seconds = firstIntegerIn(out.detail);
    }

    out.retryAfter = (seconds && *seconds > 0) ? std::chrono::seconds{ *seconds } : g_kDefaultRetryAfter;
    return out;
}

[[nodiscard]] ProtocolError unexpectedStatus(const HttpResponse& response, std::string_view what)
{
    return ProtocolError{ std::string{ what } + ": unexpected status " + std::to_string(response.status) };
}

// Classifies the statuses every endpoint shares; std::nullopt means the caller handles the status.
[[nodiscard]] std::optional<CommonFailure> commonFailure(const HttpResponse& response)
{
    if (response.status == g_kHttpTooManyRequests)
    {
        auto limited{ rateLimitedFrom(response) };
        lockwarden::log::warning("rate limited by remote authority, retry after ", limited.retryAfter.count(), "s");
        return CommonFailure{ std::move(limited) };
    }
    return std::nullopt;
}

[[nodiscard]] std::string verifierHex(const lockwarden::crypto::ICryptoProvider& crypto,
                                      const lockwarden::security::SecureString& secret, const AuthSalt& salt,
                                      const lockwarden::crypto::Argon2idParams& params)
{
    auto verifier{ crypto.deriveKey(lockwarden::security::asBytes(secret), std::span<const std::uint8_t>{ salt },
                                    params) };
    auto wipeVerifier{ lockwarden::security::scopeWipe(verifier) };
    return toHex(std::span<const std::uint8_t>{ verifier });
}

} // namespace

CredentialProtocol::CredentialProtocol(ProtocolConfig config, lockwarden::net::ITransport& transport,
                                       lockwarden::crypto::ICryptoProvider& crypto)
    : m_config(std::move(config)), m_transport(&transport), m_crypto(&crypto)
{
}

const ProtocolConfig& CredentialProtocol::config() const noexcept
{
    return m_config;
}

HttpResponse CredentialProtocol::get(std::string_view path, std::string_view bearer)
{
    lockwarden::net::HttpRequest request{};
    request.method = lockwarden::net::HttpMethod::Get;
    request.url = m_config.baseUrl + std::string{ path };
    request.authorization = std::string{ bearer };

    auto response{ m_transport->send(request) };
    lockwarden::log::debug("GET ", path, " -> ", response.status);
    return response;
}

HttpResponse CredentialProtocol::post(std::string_view path, std::string body, std::string_view bearer)
{
    lockwarden::net::HttpRequest request{};
    request.method = lockwarden::net::HttpMethod::Post;
    request.url = m_config.baseUrl + std::string{ path };
    request.body = std::move(body);
    request.authorization = std::string{ bearer };
    auto wipeBody{ lockwarden::security::scopeWipe(request.body) };

    auto response{ m_transport->send(request) };
    lockwarden::log::debug("POST ", path, " -> ", response.status);
    return response;
}

SaltResult CredentialProtocol::lookupSalt(std::string_view username)
{
    HttpResponse response{};
    try
    {
        response = get("/auth_salt/" + percentEncode(username));
    }
    catch (const lockwarden::net::TransportError& e)
    {
        return NetworkError{ e.what() };
    }

    if (response.status == g_kHttpNotFound)
    {
        return NotFound{};
    }
    if (auto failure{ commonFailure(response) })
    {
        return widen<SaltResult>(std::move(*failure));
    }
    if (response.status != g_kHttpOk)
    {
        return unexpectedStatus(response, "auth_salt");
    }

    const auto doc{ parseObject(response.body) };
    AuthSalt salt{};
    if (!doc || !doc->contains("salt") || !(*doc)["salt"].is_string() ||
        !fromHexInto((*doc)["salt"].get<std::string>(), std::span<std::uint8_t>{ salt }))
    {
        return ProtocolError{ "auth_salt: malformed salt" };
    }
    return salt;
}

RegisterResult CredentialProtocol::registerAccount(std::string_view username,
                                                   const lockwarden::security::SecureString& secret)
{
    if (username.empty())
    {
        return RejectedInput{ "username must not be empty" };
    }
    if (secret.empty())
    {
        return RejectedInput{ "password must not be empty" };
    }

    AuthSalt salt{};
    if (!m_crypto->fillRandom(std::span<std::uint8_t>{ salt }))
    {
        throw std::runtime_error("registerAccount: CSPRNG failure");
    }

    std::string verifier{ verifierHex(*m_crypto, secret, salt, m_config.kdf) };
    auto wipeVerifier{ lockwarden::security::scopeWipe(verifier) };

    Json body{
        { "username", std::string{ username } },
        { "salt", toHex(std::span<const std::uint8_t>{ salt }) },
        { "verifier", verifier },
    };
    auto wipeBodyVerifier{ lockwarden::security::scopeWipe(body["verifier"].get_ref<std::string&>()) };

    HttpResponse response{};
    try
    {
        response = post("/register", body.dump());
    }
    catch (const lockwarden::net::TransportError& e)
    {
        return NetworkError{ e.what() };
    }

    if (response.status == g_kHttpOk || response.status == g_kHttpCreated)
    {
        lockwarden::log::info("registered account ", username);
        return std::monostate{};
    }
    if (response.status == g_kHttpBadRequest || response.status == g_kHttpConflict)
    {
        return UsernameTaken{};
    }
    if (auto failure{ commonFailure(response) })
    {
        return widen<RegisterResult>(std::move(*failure));
    }
    return unexpectedStatus(response, "register");
}

LoginResult CredentialProtocol::login(std::string_view username, const lockwarden::security::SecureString& secret)
{
    return submitVerifier("/login", username, secret, std::nullopt);
}

LoginResult CredentialProtocol::loginWithSecondFactor(std::string_view username,
                                                      const lockwarden::security::SecureString& secret,
                                                      std::string_view code)
{
    return submitVerifier("/login/mfa", username, secret, code);
}

LoginResult CredentialProtocol::submitVerifier(std::string_view path, std::string_view username,
                                               const lockwarden::security::SecureString& secret,
                                               std::optional<std::string_view> code)
{
    auto saltResult{ lookupSalt(username) };
    if (!std::holds_alternative<AuthSalt>(saltResult))
    {
        return std::visit(
            [](auto&& alt) -> LoginResult
            {
                using Alt = std::decay_t<decltype(alt)>;
                if constexpr (std::is_same_v<Alt, AuthSalt>)
                {
                    return ProtocolError{ "unreachable" };
                }
                else
                {
                    return LoginResult{ std::forward<decltype(alt)>(alt) };
                }
            },
            std::move(saltResult));
    }
    if (secret.empty())
    {
        return InvalidCredentials{};
    }

    std::string verifier{ verifierHex(*m_crypto, secret, std::get<AuthSalt>(saltResult), m_config.kdf) };
    auto wipeVerifier{ lockwarden::security::scopeWipe(verifier) };

    Json body{ { "username", std::string{ username } }, { "verifier", verifier } };
    auto wipeBodyVerifier{ lockwarden::security::scopeWipe(body["verifier"].get_ref<std::string&>()) };
    if (code.has_value())
    {
        body["mfa_code"] = std::string{ *code };
    }

    HttpResponse response{};
    try
    {
        response = post(path, body.dump());
    }
    catch (const lockwarden::net::TransportError& e)
    {
        return NetworkError{ e.what() };
    }

    if (response.status == g_kHttpBadRequest || response.status == g_kHttpUnauthorized)
    {
        lockwarden::log::info("login rejected for ", username);
        return InvalidCredentials{};
    }
    if (response.status == g_kHttpForbidden)
    {
        return MfaRequired{};
    }
    if (auto failure{ commonFailure(response) })
    {
        return widen<LoginResult>(std::move(*failure));
    }
    if (response.status != g_kHttpOk)
    {
        return unexpectedStatus(response, "login");
    }

    const auto doc{ parseObject(response.body) };
    if (!doc || !doc->contains("token") || !(*doc)["token"].is_string() || (*doc)["token"].get<std::string>().empty())
    {
        return ProtocolError{ "login: missing token" };
    }
    lockwarden::log::info("login accepted for ", username);
    return SessionToken{ (*doc)["token"].get<std::string>() };
}

MfaStatusResult CredentialProtocol::mfaStatus(std::string_view username)
{
    HttpResponse response{};
    try
    {
        response = get("/mfa/status/" + percentEncode(username));
    }
    catch (const lockwarden::net::TransportError& e)
    {
        return NetworkError{ e.what() };
    }

    if (response.status == g_kHttpNotFound)
    {
        return NotFound{};
    }
    if (auto failure{ commonFailure(response) })
    {
        return widen<MfaStatusResult>(std::move(*failure));
    }
    if (response.status != g_kHttpOk)
    {
        return unexpectedStatus(response, "mfa/status");
    }

    const auto doc{ parseObject(response.body) };
    if (!doc || !doc->contains("mfa_enabled") || !(*doc)["mfa_enabled"].is_boolean())
    {
        return ProtocolError{ "mfa/status: malformed body" };
    }
    return (*doc)["mfa_enabled"].get<bool>();
}

EnrollResult CredentialProtocol::enrollSecondFactor(const SessionToken& token)
{
    HttpResponse response{};
    try
    {
        response = post("/mfa/setup", "{}", token.value);
    }
    catch (const lockwarden::net::TransportError& e)
    {
        return NetworkError{ e.what() };
    }

    if (response.status == g_kHttpUnauthorized || response.status == g_kHttpForbidden)
    {
        return InvalidCredentials{};
    }
    if (auto failure{ commonFailure(response) })
    {
        return widen<EnrollResult>(std::move(*failure));
    }
    if (response.status != g_kHttpOk)
    {
        return unexpectedStatus(response, "mfa/setup");
    }

    auto wipeBody{ lockwarden::security::scopeWipe(response.body) };
    auto doc{ parseObject(response.body) };
    if (!doc || !doc->contains("secret") || !(*doc)["secret"].is_string())
    {
        return ProtocolError{ "mfa/setup: missing secret" };
    }

    SecondFactorEnrollment out{};
    {
        auto& secret{ (*doc)["secret"].get_ref<std::string&>() };
        out.sharedSecret = lockwarden::security::secureStringFrom(secret);
        auto wipeSecret{ lockwarden::security::scopeWipe(secret) };
    }
    out.provisioningUri = stringOr(*doc, "provisioning_uri");
    out.qrCode = stringOr(*doc, "qr_code");
    if (const auto codes{ doc->find("backup_codes") }; codes != doc->end() && codes->is_array())
    {
        for (auto& code : *codes)
        {
            if (!code.is_string())
            {
                return ProtocolError{ "mfa/setup: malformed backup codes" };
            }
            auto& text{ code.get_ref<std::string&>() };
            out.recoveryCodes.push_back(lockwarden::security::secureStringFrom(text));
            auto wipeText{ lockwarden::security::scopeWipe(text) };
        }
    }
    return out;
}

ToggleResult CredentialProtocol::verifySecondFactor(std::string_view username, std::string_view code)
{
    const Json body{ { "username", std::string{ username } }, { "code", std::string{ code } } };

    HttpResponse response{};
    try
    {
        response = post("/mfa/verify", body.dump());
    }
    catch (const lockwarden::net::TransportError& e)
    {
        return NetworkError{ e.what() };
    }

    if (response.status == g_kHttpOk)
    {
        return true;
    }
    if (response.status == g_kHttpBadRequest || response.status == g_kHttpUnauthorized)
    {
        return false;
    }
    if (auto failure{ commonFailure(response) })
    {
        return widen<ToggleResult>(std::move(*failure));
    }
    return unexpectedStatus(response, "mfa/verify");
}

ToggleResult CredentialProtocol::disableSecondFactor(const SessionToken& token)
{
    HttpResponse response{};
    try
    {
        response = post("/mfa/disable", "{}", token.value);
    }
    catch (const lockwarden::net::TransportError& e)
    {
        return NetworkError{ e.what() };
    }

    if (response.status == g_kHttpOk)
    {
        return true;
    }
    if (response.status == g_kHttpUnauthorized)
    {
        return false;
    }
    if (auto failure{ commonFailure(response) })
    {
        return widen<ToggleResult>(std::move(*failure));
    }
    return unexpectedStatus(response, "mfa/disable");
}

FetchVaultResult CredentialProtocol::fetchVault(const SessionToken& token)
{
    HttpResponse response{};
    try
    {
        response = get("/vault", token.value);
    }
    catch (const lockwarden::net::TransportError& e)
    {
        return NetworkError{ e.what() };
    }

    if (response.status == g_kHttpUnauthorized || response.status == g_kHttpForbidden)
    {
        return InvalidCredentials{};
    }
    if (auto failure{ commonFailure(response) })
    {
        return widen<FetchVaultResult>(std::move(*failure));
    }
    if (response.status != g_kHttpOk)
    {
        return unexpectedStatus(response, "vault");
    }

    const auto doc{ parseObject(response.body) };
    if (!doc)
    {
        return ProtocolError{ "vault: malformed body" };
    }
    const auto blob{ doc->find("blob") };
    if (blob == doc->end() || blob->is_null())
    {
        return std::optional<SealedVault>{};
    }
    if (!blob->is_object())
    {
        return ProtocolError{ "vault: malformed blob" };
    }

    auto sealed{ decodeSealedVault(blob->dump()) };
    if (!sealed)
    {
        return ProtocolError{ "vault: malformed blob" };
    }
    return std::optional<SealedVault>{ std::move(*sealed) };
}

StoreVaultResult CredentialProtocol::storeVault(const SessionToken& token, const SealedVault& sealed)
{
    Json body = Json::object();
    body["blob"] = Json::parse(encodeSealedVault(sealed));

    HttpResponse response{};
    try
    {
        response = post("/vault", body.dump(), token.value);
    }
    catch (const lockwarden::net::TransportError& e)
    {
        return NetworkError{ e.what() };
    }

    if (response.status == g_kHttpOk || response.status == g_kHttpCreated)
    {
        return std::monostate{};
    }
    if (response.status == g_kHttpUnauthorized || response.status == g_kHttpForbidden)
    {
        return InvalidCredentials{};
    }
    if (auto failure{ commonFailure(response) })
    {
        return widen<StoreVaultResult>(std::move(*failure));
    }
    return unexpectedStatus(response, "vault");
}

} // namespace lockwarden::core
