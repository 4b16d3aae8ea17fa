#ifndef INCLUDE_LOCKWARDEN_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_LOCKWARDEN_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "lockwarden/crypto/ICryptoProvider.hpp"
#include <memory>

namespace lockwarden::crypto::providers
{

// Argon2id and XChaCha20-Poly1305 from Monocypher, randomness from getrandom(2).
// Stateless: one instance may be shared by the vault cipher and the credential protocol.
[[nodiscard]] std::unique_ptr<ICryptoProvider> makeNativeCryptoProvider();

} // namespace lockwarden::crypto::providers

#endif // INCLUDE_LOCKWARDEN_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
