#include "lockwarden/core/Session.hpp"
#include "lockwarden/security/MemoryWiper.hpp"

#include <span>
#include <utility>

namespace lockwarden::core
{

Session::Session(std::string username) : m_username(std::move(username))
{
}

Session::Session(Session&& other) noexcept
    : m_username(std::move(other.m_username)), m_token(std::move(other.m_token)),
      m_secret(std::move(other.m_secret)), m_collection(std::move(other.m_collection)),
      m_sealed(std::move(other.m_sealed))
{
    other.m_token.reset();
    other.m_sealed.reset();
}

Session& Session::operator=(Session&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }

    lockDown();
    m_username = std::move(other.m_username);
    m_token = std::move(other.m_token);
    m_secret = std::move(other.m_secret);
    m_collection = std::move(other.m_collection);
    m_sealed = std::move(other.m_sealed);

    other.m_token.reset();
    other.m_sealed.reset();
    return *this;
}

Session::~Session() noexcept
{
    lockDown();
}

const std::string& Session::username() const noexcept
{
    return m_username;
}

const std::optional<SessionToken>& Session::token() const noexcept
{
    return m_token;
}

void Session::setToken(SessionToken token)
{
    m_token = std::move(token);
}

const lockwarden::security::SecureString& Session::secret() const noexcept
{
    return m_secret;
}

void Session::setSecret(lockwarden::security::SecureString secret) noexcept
{
    lockwarden::security::secureRelease(m_secret);
    m_secret = std::move(secret);
}

const CredentialCollection& Session::collection() const noexcept
{
    return m_collection;
}

void Session::setCollection(CredentialCollection collection) noexcept
{
    m_collection.clear();
    m_collection = std::move(collection);
}

const std::optional<SealedVault>& Session::sealed() const noexcept
{
    return m_sealed;
}

void Session::setSealed(std::optional<SealedVault> sealed) noexcept
{
    m_sealed = std::move(sealed);
}

void Session::lockDown() noexcept
{
    if (m_token.has_value())
    {
        lockwarden::security::secureWipe(m_token->value);
        m_token.reset();
    }
    lockwarden::security::secureRelease(m_secret);
    m_collection.clear();
}

} // namespace lockwarden::core
