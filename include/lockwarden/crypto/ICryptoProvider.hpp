#ifndef INCLUDE_LOCKWARDEN_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_LOCKWARDEN_CRYPTO_ICRYPTOPROVIDER_HPP

#include "lockwarden/crypto/KdfParams.hpp"
#include "lockwarden/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace lockwarden::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 24 };
constexpr std::size_t g_aeadTagBytes{ 16 };

using AeadNonce = std::array<std::uint8_t, g_aeadNonceBytes>;

// XChaCha20-Poly1305 output in the order the vault document stores it: ciphertext, then the tag.
struct AeadBox final
{
    AeadNonce nonce{};
    std::vector<std::uint8_t> sealed;
};

// Everything the vault and the credential protocol need from a crypto backend.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Argon2id into a 32-byte key. An empty secret, a salt other than 16 bytes or out-of-range
    // parameters throw std::invalid_argument.
    [[nodiscard]] virtual lockwarden::security::SecureBuffer deriveKey(std::span<const std::byte> secret,
                                                                       std::span<const std::uint8_t> salt,
                                                                       const Argon2idParams& params) const = 0;

    [[nodiscard]] virtual bool fillRandom(std::span<std::uint8_t> out) noexcept = 0;

    // A fresh random nonce per call. A key other than 32 bytes throws std::invalid_argument.
    [[nodiscard]] virtual AeadBox seal(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                       std::span<const std::byte> associatedData) = 0;

    // std::nullopt when the tag does not verify or sealed is too short to hold one.
    [[nodiscard]] virtual std::optional<lockwarden::security::SecureBuffer>
    open(std::span<const std::uint8_t> key, const AeadNonce& nonce, std::span<const std::uint8_t> sealed,
         std::span<const std::byte> associatedData) = 0;
};

} // namespace lockwarden::crypto

#endif // INCLUDE_LOCKWARDEN_CRYPTO_ICRYPTOPROVIDER_HPP
