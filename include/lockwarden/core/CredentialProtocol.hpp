#ifndef INCLUDE_LOCKWARDEN_CORE_CREDENTIALPROTOCOL_HPP
#define INCLUDE_LOCKWARDEN_CORE_CREDENTIALPROTOCOL_HPP

#include "lockwarden/core/ProtocolErrors.hpp"
#include "lockwarden/core/VaultCipher.hpp"
#include "lockwarden/crypto/ICryptoProvider.hpp"
#include "lockwarden/crypto/KdfParams.hpp"
#include "lockwarden/net/ITransport.hpp"
#include "lockwarden/security/SecureString.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lockwarden::core
{

struct ProtocolConfig final
{
    std::string baseUrl;
    lockwarden::crypto::Argon2idParams kdf{ lockwarden::crypto::g_kArgon2idDefaultParams };
};

using AuthSalt = lockwarden::crypto::Salt;

// Opaque bearer string; no relation to any key material.
struct SessionToken final
{
    std::string value;
};

struct SecondFactorEnrollment final
{
    lockwarden::security::SecureString sharedSecret; // base32
    std::string provisioningUri;
    std::string qrCode;
    std::vector<lockwarden::security::SecureString> recoveryCodes;
};

using SaltResult = std::variant<AuthSalt, NotFound, RateLimited, NetworkError, ProtocolError>;
using RegisterResult =
    std::variant<std::monostate, UsernameTaken, RejectedInput, RateLimited, NetworkError, ProtocolError>;
using LoginResult =
    std::variant<SessionToken, NotFound, InvalidCredentials, MfaRequired, RateLimited, NetworkError, ProtocolError>;
using MfaStatusResult = std::variant<bool, NotFound, RateLimited, NetworkError, ProtocolError>;
using EnrollResult = std::variant<SecondFactorEnrollment, InvalidCredentials, RateLimited, NetworkError, ProtocolError>;
using ToggleResult = std::variant<bool, RateLimited, NetworkError, ProtocolError>;
using FetchVaultResult =
    std::variant<std::optional<SealedVault>, InvalidCredentials, RateLimited, NetworkError, ProtocolError>;
using StoreVaultResult = std::variant<std::monostate, InvalidCredentials, RateLimited, NetworkError, ProtocolError>;

// Zero-knowledge login against the remote authority: only salts, verifiers and sealed vaults cross the wire.
class CredentialProtocol final
{
public:
    CredentialProtocol(ProtocolConfig config, lockwarden::net::ITransport& transport,
                       lockwarden::crypto::ICryptoProvider& crypto);

    [[nodiscard]] const ProtocolConfig& config() const noexcept;

    [[nodiscard]] SaltResult lookupSalt(std::string_view username);

    // Generates the auth salt; only {username, salt, verifier} are submitted. An empty username or secret
    // is RejectedInput. Throws std::runtime_error only if the CSPRNG fails.
    [[nodiscard]] RegisterResult registerAccount(std::string_view username,
                                                 const lockwarden::security::SecureString& secret);

    // Salt lookup, then verifier derivation, then submission. No other order is valid.
    [[nodiscard]] LoginResult login(std::string_view username, const lockwarden::security::SecureString& secret);

    [[nodiscard]] MfaStatusResult mfaStatus(std::string_view username);

    [[nodiscard]] LoginResult loginWithSecondFactor(std::string_view username,
                                                    const lockwarden::security::SecureString& secret,
                                                    std::string_view code);

    [[nodiscard]] EnrollResult enrollSecondFactor(const SessionToken& token);
    [[nodiscard]] ToggleResult verifySecondFactor(std::string_view username, std::string_view code);
    [[nodiscard]] ToggleResult disableSecondFactor(const SessionToken& token);

    // std::nullopt when the account has never stored a vault.
    [[nodiscard]] FetchVaultResult fetchVault(const SessionToken& token);

    // Replaces the remote vault wholesale.
    [[nodiscard]] StoreVaultResult storeVault(const SessionToken& token, const SealedVault& sealed);

private:
    ProtocolConfig m_config;
    lockwarden::net::ITransport* m_transport{ nullptr };
    lockwarden::crypto::ICryptoProvider* m_crypto{ nullptr };

    [[nodiscard]] lockwarden::net::HttpResponse get(std::string_view path, std::string_view bearer = {});
    [[nodiscard]] lockwarden::net::HttpResponse post(std::string_view path, std::string body,
                                                     std::string_view bearer = {});

    [[nodiscard]] LoginResult submitVerifier(std::string_view path, std::string_view username,
                                             const lockwarden::security::SecureString& secret,
                                             std::optional<std::string_view> code);
};

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_CREDENTIALPROTOCOL_HPP
