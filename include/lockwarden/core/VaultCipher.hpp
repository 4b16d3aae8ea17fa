#ifndef INCLUDE_LOCKWARDEN_CORE_VAULTCIPHER_HPP
#define INCLUDE_LOCKWARDEN_CORE_VAULTCIPHER_HPP

#include "lockwarden/core/CredentialCollection.hpp"
#include "lockwarden/crypto/ICryptoProvider.hpp"
#include "lockwarden/crypto/KdfParams.hpp"
#include "lockwarden/security/SecureString.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lockwarden::core
{

enum class VaultError : std::uint8_t
{
    RandomFailed,
    InvalidInput,
    CryptoError,
    DecryptionFailure,
    InvalidVaultFormat,
};

template <class T> using VaultResult = std::variant<T, VaultError>;

// The only vault artifact that leaves memory. cipherText is ciphertext || 16-byte tag.
struct SealedVault final
{
    lockwarden::crypto::Salt vaultSalt{};
    std::array<std::uint8_t, lockwarden::crypto::g_aeadNonceBytes> nonce{};
    std::vector<std::uint8_t> cipherText;

    [[nodiscard]] friend bool operator==(const SealedVault&, const SealedVault&) = default;
};

// {"vault_salt": hex16, "nonce": hex24, "ciphertext": hex}
[[nodiscard]] std::string encodeSealedVault(const SealedVault& sealed);
[[nodiscard]] std::optional<SealedVault> decodeSealedVault(std::string_view json);

class VaultCipher final
{
public:
    VaultCipher(lockwarden::crypto::ICryptoProvider& crypto, lockwarden::crypto::Argon2idParams params,
                TimestampProvider now = currentTimestamp);

    // Fresh vault salt and nonce on every call; repeated seals of identical input are unlinkable.
    [[nodiscard]] VaultResult<SealedVault> seal(const CredentialCollection& collection,
                                                const lockwarden::security::SecureString& secret) noexcept;

    // Any authentication failure is reported as DecryptionFailure, never as partial plaintext.
    [[nodiscard]] VaultResult<CredentialCollection> unseal(const SealedVault& sealed,
                                                           const lockwarden::security::SecureString& secret) noexcept;

private:
    lockwarden::crypto::ICryptoProvider* m_crypto{ nullptr };
    lockwarden::crypto::Argon2idParams m_params{};
    TimestampProvider m_now;
};

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_VAULTCIPHER_HPP
