#ifndef INCLUDE_LOCKWARDEN_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_LOCKWARDEN_CRYPTO_KDFPARAMS_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace lockwarden::crypto
{

constexpr std::size_t g_argon2SaltBytes{ 16 };
constexpr std::size_t g_derivedKeyBytes{ 32 };

using Salt = std::array<std::uint8_t, g_argon2SaltBytes>;

struct Argon2idParams final
{
    std::uint32_t iterations;
    std::uint32_t memoryKiB;
    std::uint32_t parallelism;
};

// Shared by verifier and vault-key derivation: 3 passes, 128 MiB, 4 lanes.
constexpr Argon2idParams g_kArgon2idDefaultParams{ .iterations = 3U, .memoryKiB = 128U * 1024U, .parallelism = 4U };

} // namespace lockwarden::crypto

#endif // INCLUDE_LOCKWARDEN_CRYPTO_KDFPARAMS_HPP
