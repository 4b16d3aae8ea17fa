#ifndef INCLUDE_LOCKWARDEN_AUTHORITY_LOCAL_LOCALAUTHORITYFACTORY_HPP
#define INCLUDE_LOCKWARDEN_AUTHORITY_LOCAL_LOCALAUTHORITYFACTORY_HPP

#include "lockwarden/net/ITransport.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace lockwarden::authority::local
{

struct LocalAuthorityConfig final
{
    // Requests whose URL does not start with this prefix fail with TransportError.
    std::string baseUrl{ "local://authority" };
    std::filesystem::path databasePath{ ":memory:" };
    std::uint32_t maxFailedAttempts{ 5U };
    std::chrono::seconds failureWindow{ 60 };
    std::chrono::seconds retryAfter{ 30 };
    std::string issuer{ "Lockwarden" };
    // Unix seconds. Empty means the system clock.
    std::function<std::uint64_t()> clock;
};

// An in-process remote authority speaking the JSON endpoints of the credential protocol, backed by SQLite.
// Stores salts, verifiers and sealed vaults only.
[[nodiscard]] std::unique_ptr<lockwarden::net::ITransport> makeLocalAuthority(LocalAuthorityConfig config);

} // namespace lockwarden::authority::local

#endif // INCLUDE_LOCKWARDEN_AUTHORITY_LOCAL_LOCALAUTHORITYFACTORY_HPP
