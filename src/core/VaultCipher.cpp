#include "lockwarden/core/VaultCipher.hpp"
#include "lockwarden/core/HexCodec.hpp"
#include "lockwarden/log/Log.hpp"
#include "lockwarden/security/ScopeWipe.hpp"

#include <nlohmann/json.hpp>

#include <span>
#include <stdexcept>
#include <utility>

namespace lockwarden::core
{
namespace
{

using Json = nlohmann::json;

[[nodiscard]] VaultResult<lockwarden::security::SecureBuffer>
deriveVaultKeyOrError(const lockwarden::crypto::ICryptoProvider& crypto,
                      const lockwarden::security::SecureString& secret, const lockwarden::crypto::Salt& salt,
                      const lockwarden::crypto::Argon2idParams& params) noexcept
{
    try
    {
        return crypto.deriveKey(lockwarden::security::asBytes(secret), std::span<const std::uint8_t>{ salt }, params);
    }
    catch (const std::invalid_argument& e)
    {
        lockwarden::log::warning("vault key derivation rejected input: ", e.what());
        return VaultError::InvalidInput;
    }
    catch (const std::exception& e)
    {
        lockwarden::log::error("vault key derivation failed: ", e.what());
        return VaultError::CryptoError;
    }
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

} // namespace

std::string encodeSealedVault(const SealedVault& sealed)
{
    const Json doc{
        { "vault_salt", toHex(std::span<const std::uint8_t>{ sealed.vaultSalt }) },
        { "nonce", toHex(std::span<const std::uint8_t>{ sealed.nonce }) },
        { "ciphertext", toHex(std::span<const std::uint8_t>{ sealed.cipherText }) },
    };
    return doc.dump();
}

std::optional<SealedVault> decodeSealedVault(std::string_view json)
{
    const Json doc = Json::parse(json, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
    {
        return std::nullopt;
    }

    const auto saltHex{ stringField(doc, "vault_salt") };
    const auto nonceHex{ stringField(doc, "nonce") };
    const auto cipherHex{ stringField(doc, "ciphertext") };
    if (!saltHex || !nonceHex || !cipherHex)
    {
        return std::nullopt;
    }

    SealedVault out{};
    if (!fromHexInto(*saltHex, std::span<std::uint8_t>{ out.vaultSalt }) ||
        !fromHexInto(*nonceHex, std::span<std::uint8_t>{ out.nonce }))
    {
        return std::nullopt;
    }

    auto cipherText{ fromHex(*cipherHex) };
    if (!cipherText || cipherText->size() < lockwarden::crypto::g_aeadTagBytes)
    {
        return std::nullopt;
    }
    out.cipherText = std::move(*cipherText);
    return out;
}

VaultCipher::VaultCipher(lockwarden::crypto::ICryptoProvider& crypto, lockwarden::crypto::Argon2idParams params,
                         TimestampProvider now)
    : m_crypto(&crypto), m_params(params), m_now(std::move(now))
{
}

VaultResult<SealedVault> VaultCipher::seal(const CredentialCollection& collection,
                                           const lockwarden::security::SecureString& secret) noexcept
{
    SealedVault out{};
    if (!m_crypto->fillRandom(std::span<std::uint8_t>{ out.vaultSalt }))
    {
        return VaultError::RandomFailed;
    }

    auto keyResult{ deriveVaultKeyOrError(*m_crypto, secret, out.vaultSalt, m_params) };
    if (auto* err = std::get_if<VaultError>(&keyResult))
    {
        return *err;
    }
    auto& vaultKey{ std::get<lockwarden::security::SecureBuffer>(keyResult) };
    auto wipeKey{ lockwarden::security::scopeWipe(vaultKey) };

    try
    {
        auto plain{ serializeCollection(collection) };
        auto wipePlain{ lockwarden::security::scopeWipe(plain) };

        auto box{ m_crypto->seal(vaultKey, lockwarden::security::asBytes(plain), std::span<const std::byte>{}) };
        out.nonce = box.nonce;
        out.cipherText = std::move(box.sealed);
    }
    catch (const std::exception& e)
    {
        lockwarden::log::error("vault seal failed: ", e.what());
        return VaultError::CryptoError;
    }

    lockwarden::log::debug("vault sealed (", collection.size(), " entries)");
    return out;
}

VaultResult<CredentialCollection> VaultCipher::unseal(const SealedVault& sealed,
                                                      const lockwarden::security::SecureString& secret) noexcept
{
    if (sealed.cipherText.size() < lockwarden::crypto::g_aeadTagBytes)
    {
        return VaultError::DecryptionFailure;
    }

    auto keyResult{ deriveVaultKeyOrError(*m_crypto, secret, sealed.vaultSalt, m_params) };
    if (auto* err = std::get_if<VaultError>(&keyResult))
    {
        return *err;
    }
    auto& vaultKey{ std::get<lockwarden::security::SecureBuffer>(keyResult) };
    auto wipeKey{ lockwarden::security::scopeWipe(vaultKey) };

    try
    {
        auto plain{ m_crypto->open(vaultKey, sealed.nonce, sealed.cipherText, std::span<const std::byte>{}) };
        if (!plain)
        {
            return VaultError::DecryptionFailure;
        }
        auto wipePlain{ lockwarden::security::scopeWipe(*plain) };

        auto collection{ deserializeCollection(std::span<const std::uint8_t>{ *plain }, m_now) };
        if (!collection)
        {
            lockwarden::log::warning("vault authenticated but its plaintext is not a credential collection");
            return VaultError::InvalidVaultFormat;
        }
        return std::move(*collection);
    }
    catch (const std::exception& e)
    {
        lockwarden::log::error("vault unseal failed: ", e.what());
        return VaultError::CryptoError;
    }
}

} // namespace lockwarden::core
