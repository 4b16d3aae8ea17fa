#ifndef INTERNAL_INCLUDE_LOCKWARDEN_CRYPTO_KEYDERIVATION_HPP
#define INTERNAL_INCLUDE_LOCKWARDEN_CRYPTO_KEYDERIVATION_HPP

#include "lockwarden/crypto/KdfParams.hpp"
#include "lockwarden/security/SecureBuffer.hpp"
#include <cstddef>
#include <span>

namespace lockwarden::crypto
{

[[nodiscard]] lockwarden::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> secret,
                                                                   std::span<const std::byte> salt,
                                                                   Argon2idParams params);

} // namespace lockwarden::crypto

#endif // INTERNAL_INCLUDE_LOCKWARDEN_CRYPTO_KEYDERIVATION_HPP
