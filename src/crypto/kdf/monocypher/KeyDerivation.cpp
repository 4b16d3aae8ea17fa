#include "lockwarden/crypto/KeyDerivation.hpp"

#include "lockwarden/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace lockwarden::crypto
{
namespace
{

constexpr std::uint32_t g_kMinBlocksPerLane{ 8U };
constexpr std::uint32_t g_kSegmentsPerLane{ 4U };
constexpr std::uint32_t g_kMemoryKiBCap{ 1024U * 1024U };
constexpr std::uint32_t g_kIterationsCap{ 10U };
constexpr std::uint32_t g_kParallelismCap{ 16U };

void requireSaneParams(const Argon2idParams& params)
{
    if (params.iterations == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("deriveKeyArgon2id: invalid parameters");
    }
    if (params.memoryKiB > g_kMemoryKiBCap || params.iterations > g_kIterationsCap ||
        params.parallelism > g_kParallelismCap)
    {
        throw std::invalid_argument("deriveKeyArgon2id: unsafe parameters");
    }
    // Monocypher splits memory into lanes of four segments each.
    if (params.memoryKiB < g_kMinBlocksPerLane * params.parallelism ||
        params.memoryKiB % (g_kSegmentsPerLane * params.parallelism) != 0U)
    {
        throw std::invalid_argument("deriveKeyArgon2id: memory does not fit parallelism");
    }
}

} // namespace

[[nodiscard]] lockwarden::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> secret,
                                                                   std::span<const std::byte> salt,
                                                                   Argon2idParams params)
{
    if (secret.empty())
    {
        throw std::invalid_argument("deriveKeyArgon2id: empty secret");
    }
    if (salt.size() != g_argon2SaltBytes)
    {
        throw std::invalid_argument("deriveKeyArgon2id: invalid salt size");
    }
    if (secret.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKeyArgon2id: secret too large");
    }
    requireSaneParams(params);

    constexpr std::size_t kU64WordsPerKiB{ 128U }; // 1024 / sizeof(uint64_t)
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB };
    std::vector<std::uint64_t, lockwarden::security::ZeroAllocator<std::uint64_t>> workArea(workWords);

    lockwarden::security::SecureBuffer key(g_derivedKeyBytes);

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.parallelism };

    const crypto_argon2_inputs inputs{ .pass = reinterpret_cast<const std::uint8_t*>(secret.data()),
                                       .salt = reinterpret_cast<const std::uint8_t*>(salt.data()),
                                       .pass_size = static_cast<std::uint32_t>(secret.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(key.data(), static_cast<std::uint32_t>(key.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);

    return key;
}

} // namespace lockwarden::crypto
