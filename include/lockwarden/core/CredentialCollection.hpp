#ifndef INCLUDE_LOCKWARDEN_CORE_CREDENTIALCOLLECTION_HPP
#define INCLUDE_LOCKWARDEN_CORE_CREDENTIALCOLLECTION_HPP

#include "lockwarden/security/SecureBuffer.hpp"
#include "lockwarden/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lockwarden::core
{

// Produces "YYYY-MM-DD HH:MM".
using TimestampProvider = std::function<std::string()>;

// Local wall-clock time at minute precision.
[[nodiscard]] std::string currentTimestamp();

struct CredentialRecord final
{
    lockwarden::security::SecureString secret;
    std::string updatedAt;
    std::optional<std::string> category;
    std::map<std::string, std::string, std::less<>> extra;
};

[[nodiscard]] bool operator==(const CredentialRecord& lhs, const CredentialRecord& rhs) noexcept;

// Entry as it was stored before records carried metadata: only the secret.
struct LegacyEntry final
{
    lockwarden::security::SecureString secret;
};

using StoredEntry = std::variant<LegacyEntry, CredentialRecord>;

// Normalizes one stored entry. Legacy entries and records without a timestamp get one from `now`.
[[nodiscard]] CredentialRecord migrateEntry(StoredEntry entry, const TimestampProvider& now);

class CredentialCollection final
{
public:
    using Entries = std::map<std::string, CredentialRecord, std::less<>>;

    CredentialCollection() = default;
    CredentialCollection(const CredentialCollection&) = default;
    CredentialCollection& operator=(const CredentialCollection&) = default;
    CredentialCollection(CredentialCollection&&) noexcept = default;
    CredentialCollection& operator=(CredentialCollection&&) noexcept = default;
    ~CredentialCollection() = default;

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool contains(std::string_view title) const;
    [[nodiscard]] const CredentialRecord* find(std::string_view title) const;
    [[nodiscard]] std::vector<std::string> titles() const;
    [[nodiscard]] const Entries& entries() const noexcept;

    // Inserts or replaces.
    void put(std::string title, CredentialRecord record);
    bool erase(std::string_view title);

    // Wipes every secret before dropping the entries.
    void clear() noexcept;

    [[nodiscard]] friend bool operator==(const CredentialCollection& lhs, const CredentialCollection& rhs) noexcept
    {
        return lhs.m_entries == rhs.m_entries;
    }

private:
    Entries m_entries;
};

// Canonical UTF-8 JSON: {title: {"password", "updatedAt", "category"?, aux...}} with sorted keys.
[[nodiscard]] lockwarden::security::SecureBuffer serializeCollection(const CredentialCollection& collection);

// Parses both the structured and the legacy scalar entry shapes, migrating legacy entries once.
// Returns std::nullopt when the bytes are not a JSON object.
[[nodiscard]] std::optional<CredentialCollection> deserializeCollection(std::span<const std::uint8_t> bytes,
                                                                        const TimestampProvider& now);

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_CREDENTIALCOLLECTION_HPP
