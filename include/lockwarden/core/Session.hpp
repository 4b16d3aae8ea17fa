#ifndef INCLUDE_LOCKWARDEN_CORE_SESSION_HPP
#define INCLUDE_LOCKWARDEN_CORE_SESSION_HPP

#include "lockwarden/core/CredentialCollection.hpp"
#include "lockwarden/core/CredentialProtocol.hpp"
#include "lockwarden/core/VaultCipher.hpp"
#include "lockwarden/security/SecureString.hpp"
#include <optional>
#include <string>

namespace lockwarden::core
{

// Everything one signed-in user holds in memory. Plaintext material (secret, collection, token) is
// dropped by lockDown(); the username and the last known sealed vault survive it.
class Session final
{
public:
    Session() = default;
    explicit Session(std::string username);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&& other) noexcept;
    Session& operator=(Session&& other) noexcept;
    ~Session() noexcept;

    [[nodiscard]] const std::string& username() const noexcept;

    [[nodiscard]] const std::optional<SessionToken>& token() const noexcept;
    void setToken(SessionToken token);

    [[nodiscard]] const lockwarden::security::SecureString& secret() const noexcept;
    void setSecret(lockwarden::security::SecureString secret) noexcept;

    [[nodiscard]] const CredentialCollection& collection() const noexcept;
    void setCollection(CredentialCollection collection) noexcept;

    [[nodiscard]] const std::optional<SealedVault>& sealed() const noexcept;
    void setSealed(std::optional<SealedVault> sealed) noexcept;

    void lockDown() noexcept;

private:
    std::string m_username;
    std::optional<SessionToken> m_token;
    lockwarden::security::SecureString m_secret;
    CredentialCollection m_collection;
    std::optional<SealedVault> m_sealed;
};

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_SESSION_HPP
