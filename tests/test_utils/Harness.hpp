#ifndef LOCKWARDEN_TESTS_TEST_UTILS_HARNESS_HPP
#define LOCKWARDEN_TESTS_TEST_UTILS_HARNESS_HPP

#include "lockwarden/authority/local/LocalAuthorityFactory.hpp"
#include "lockwarden/core/AuditLog.hpp"
#include "lockwarden/core/CredentialProtocol.hpp"
#include "lockwarden/core/SessionLockController.hpp"
#include "lockwarden/core/VaultCipher.hpp"
#include "lockwarden/crypto/KdfParams.hpp"
#include "lockwarden/crypto/providers/NativeProviderFactory.hpp"
#include "lockwarden/net/ITransport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lockwarden::test_utils
{

// Cheap enough for unit tests while still exercising four lanes.
constexpr lockwarden::crypto::Argon2idParams g_kFastKdf{ .iterations = 1U, .memoryKiB = 64U, .parallelism = 4U };

constexpr std::uint64_t g_kFixedUnixTime{ 1'700'000'000U };
constexpr std::string_view g_kFixedTimestamp{ "2024-01-02 03:04" };

[[nodiscard]] inline lockwarden::core::TimestampProvider fixedTimestamp()
{
    return []() { return std::string{ g_kFixedTimestamp }; };
}

class MemoryAuditLog final : public lockwarden::core::IAuditLog
{
public:
    void record(std::string_view username, std::string_view action) override
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        m_entries.push_back({ std::string{ username }, std::string{ action } });
    }

    [[nodiscard]] std::vector<lockwarden::core::AuditEntry> recent(std::string_view username) const override
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        std::vector<lockwarden::core::AuditEntry> out;
        for (auto it{ m_entries.rbegin() }; it != m_entries.rend(); ++it)
        {
            if (it->first == username)
            {
                out.push_back({ std::string{ g_kFixedTimestamp } + ":00", it->second });
            }
        }
        return out;
    }

    [[nodiscard]] std::vector<std::string> actions(std::string_view username) const
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        std::vector<std::string> out;
        for (const auto& [user, action] : m_entries)
        {
            if (user == username)
            {
                out.push_back(action);
            }
        }
        return out;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, std::string>> m_entries;
};

// Forwards to another transport, optionally holding back the next request whose URL ends with a given path.
class GatedTransport final : public lockwarden::net::ITransport
{
public:
    explicit GatedTransport(lockwarden::net::ITransport& inner) : m_inner(&inner)
    {
    }

    void holdNext(std::string path)
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        m_holdPath = std::move(path);
        m_held = false;
        m_released = false;
    }

    // Blocks until a request has been caught by holdNext().
    void waitUntilHeld()
    {
        std::unique_lock<std::mutex> lock{ m_mutex };
        m_changed.wait(lock, [this]() { return m_held; });
    }

    void release()
    {
        {
            const std::lock_guard<std::mutex> guard{ m_mutex };
            m_released = true;
        }
        m_changed.notify_all();
    }

    [[nodiscard]] lockwarden::net::HttpResponse send(const lockwarden::net::HttpRequest& request) override
    {
        {
            std::unique_lock<std::mutex> lock{ m_mutex };
            if (!m_holdPath.empty() && request.url.ends_with(m_holdPath))
            {
                m_holdPath.clear();
                m_held = true;
                m_changed.notify_all();
                m_changed.wait(lock, [this]() { return m_released; });
            }
        }
        return m_inner->send(request);
    }

private:
    lockwarden::net::ITransport* m_inner{ nullptr };
    std::mutex m_mutex;
    std::condition_variable m_changed;
    std::string m_holdPath;
    bool m_held{ false };
    bool m_released{ false };
};

// Local authority, native crypto, fast KDF and a controllable clock wired together.
struct Harness final
{
    explicit Harness(lockwarden::core::SessionConfig sessionConfig = {})
        : crypto{ lockwarden::crypto::providers::makeNativeCryptoProvider() },
          authority{ lockwarden::authority::local::makeLocalAuthority(authorityConfig(clock)) },
          transport{ *authority },
          protocol{ lockwarden::core::ProtocolConfig{ .baseUrl = "local://authority", .kdf = g_kFastKdf }, transport,
                    *crypto },
          cipher{ *crypto, g_kFastKdf, fixedTimestamp() },
          controller{ std::make_unique<lockwarden::core::SessionLockController>(protocol, cipher, audit,
                                                                                 sessionConfig) }
    {
    }

    std::shared_ptr<std::atomic<std::uint64_t>> clock{ std::make_shared<std::atomic<std::uint64_t>>(
        g_kFixedUnixTime) };
    std::unique_ptr<lockwarden::crypto::ICryptoProvider> crypto;
    std::unique_ptr<lockwarden::net::ITransport> authority;
    GatedTransport transport;
    lockwarden::core::CredentialProtocol protocol;
    lockwarden::core::VaultCipher cipher;
    MemoryAuditLog audit;
    std::unique_ptr<lockwarden::core::SessionLockController> controller;

private:
    [[nodiscard]] static lockwarden::authority::local::LocalAuthorityConfig
    authorityConfig(std::shared_ptr<std::atomic<std::uint64_t>> now)
    {
        lockwarden::authority::local::LocalAuthorityConfig config{};
        config.clock = [now]() { return now->load(); };
        return config;
    }
};

} // namespace lockwarden::test_utils

#endif // LOCKWARDEN_TESTS_TEST_UTILS_HARNESS_HPP
