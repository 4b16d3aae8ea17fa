#include "lockwarden/crypto/providers/NativeProviderFactory.hpp"

#include "lockwarden/crypto/KeyDerivation.hpp"
#include "lockwarden/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>

namespace lockwarden::crypto::providers
{
namespace
{

[[nodiscard]] const std::uint8_t* bytePtr(std::span<const std::byte> bytes) noexcept
{
    return reinterpret_cast<const std::uint8_t*>(bytes.data()); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

class MonocypherProvider final : public ICryptoProvider
{
public:
    [[nodiscard]] lockwarden::security::SecureBuffer deriveKey(std::span<const std::byte> secret,
                                                               std::span<const std::uint8_t> salt,
                                                               const Argon2idParams& params) const override
    {
        return deriveKeyArgon2id(secret, std::as_bytes(salt), params);
    }

    [[nodiscard]] bool fillRandom(std::span<std::uint8_t> out) noexcept override
    {
        return lockwarden::security::secureRandomFill(out);
    }

    [[nodiscard]] AeadBox seal(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                               std::span<const std::byte> associatedData) override
    {
        if (key.size() != g_aeadKeyBytes)
        {
            throw std::invalid_argument("seal: key must be 32 bytes");
        }

        AeadBox box{};
        if (!fillRandom(box.nonce))
        {
            throw std::runtime_error("seal: CSPRNG failure");
        }
        box.sealed.resize(plainText.size() + g_aeadTagBytes);
        std::uint8_t* const mac{ box.sealed.data() + plainText.size() };
        crypto_aead_lock(box.sealed.data(), mac, key.data(), box.nonce.data(), bytePtr(associatedData),
                         associatedData.size(), bytePtr(plainText), plainText.size());
        return box;
    }

    [[nodiscard]] std::optional<lockwarden::security::SecureBuffer>
    open(std::span<const std::uint8_t> key, const AeadNonce& nonce, std::span<const std::uint8_t> sealed,
         std::span<const std::byte> associatedData) override
    {
        if (key.size() != g_aeadKeyBytes)
        {
            throw std::invalid_argument("open: key must be 32 bytes");
        }
        if (sealed.size() < g_aeadTagBytes)
        {
            return std::nullopt;
        }

        const auto cipherText{ sealed.first(sealed.size() - g_aeadTagBytes) };
        const auto mac{ sealed.last(g_aeadTagBytes) };
        lockwarden::security::SecureBuffer plainText(cipherText.size());
        if (crypto_aead_unlock(plainText.data(), mac.data(), key.data(), nonce.data(), bytePtr(associatedData),
                               associatedData.size(), cipherText.data(), cipherText.size()) != 0)
        {
            return std::nullopt;
        }
        return plainText;
    }
};

} // namespace

std::unique_ptr<ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<MonocypherProvider>();
}

} // namespace lockwarden::crypto::providers
