#ifndef INCLUDE_LOCKWARDEN_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_LOCKWARDEN_SECURITY_SCOPEWIPE_HPP

#include "lockwarden/security/MemoryWiper.hpp"
#include "lockwarden/security/SecureBuffer.hpp"
#include "lockwarden/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>

namespace lockwarden::security
{

// Wipes its target on scope exit unless released. Containers are wiped as they are at that moment, so
// the guard may be taken before the container is filled; a raw span is wiped exactly as captured.
class [[nodiscard]] ScopeWipe final
{
public:
    using Target = std::variant<std::monostate, std::span<std::byte>, std::string*, SecureString*, SecureBuffer*>;

    explicit ScopeWipe(Target target) noexcept : m_target{ target }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_target{ other.m_target }
    {
        other.release();
    }

    ~ScopeWipe() noexcept
    {
        if (const auto* bytes{ std::get_if<std::span<std::byte>>(&m_target) })
        {
            secureWipe(*bytes);
        }
        else if (const auto* text{ std::get_if<std::string*>(&m_target) })
        {
            secureWipe(**text);
        }
        else if (const auto* secret{ std::get_if<SecureString*>(&m_target) })
        {
            secureWipe(asWritableBytes(**secret));
        }
        else if (const auto* buffer{ std::get_if<SecureBuffer*>(&m_target) })
        {
            secureWipe(asWritableBytes(**buffer));
        }
    }

    void release() noexcept
    {
        m_target = std::monostate{};
    }

private:
    Target m_target;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> bytes) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(bytes) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& buffer) noexcept
{
    return ScopeWipe{ &buffer };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& secret) noexcept
{
    return ScopeWipe{ &secret };
}

// Scratch strings (JSON dumps, hex text, typed codes) that briefly hold secrets.
[[nodiscard]] inline ScopeWipe scopeWipe(std::string& text) noexcept
{
    return ScopeWipe{ &text };
}

} // namespace lockwarden::security

#endif // INCLUDE_LOCKWARDEN_SECURITY_SCOPEWIPE_HPP
