#include "lockwarden/core/CredentialCollection.hpp"
#include "lockwarden/security/ScopeWipe.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace lockwarden::core
{
namespace
{

using Json = nlohmann::json;

constexpr std::string_view g_kPasswordKey{ "password" };
constexpr std::string_view g_kUpdatedAtKey{ "updatedAt" };
constexpr std::string_view g_kCategoryKey{ "category" };

// Overwrites every string held by the document so plaintext does not outlive it in freed heap blocks.
void wipeJsonStrings(Json& doc) noexcept
{
    if (doc.is_string())
    {
        auto& text{ doc.get_ref<std::string&>() };
        lockwarden::security::secureWipe(text);
        return;
    }
    if (doc.is_structured())
    {
        for (auto& child : doc)
        {
            wipeJsonStrings(child);
        }
    }
}

[[nodiscard]] std::string scalarText(const Json& value)
{
    if (value.is_string())
    {
        return value.get<std::string>();
    }
    if (value.is_null())
    {
        return {};
    }
    return value.dump();
}

[[nodiscard]] StoredEntry decodeEntry(const Json& value)
{
    if (!value.is_object())
    {
        std::string text{ scalarText(value) };
        auto wipeText{ lockwarden::security::scopeWipe(text) };
        return LegacyEntry{ lockwarden::security::secureStringFrom(text) };
    }

    CredentialRecord record{};
    for (const auto& [key, field] : value.items())
    {
        std::string text{ scalarText(field) };
        auto wipeText{ lockwarden::security::scopeWipe(text) };
        if (key == g_kPasswordKey)
        {
            record.secret = lockwarden::security::secureStringFrom(text);
        }
        else if (key == g_kUpdatedAtKey)
        {
            record.updatedAt = text;
        }
        else if (key == g_kCategoryKey)
        {
            record.category = text;
        }
        else
        {
            record.extra.emplace(key, text);
        }
    }
    return record;
}

} // namespace

std::string currentTimestamp()
{
    const std::time_t now{ std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()) };
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return out.str();
}

bool operator==(const CredentialRecord& lhs, const CredentialRecord& rhs) noexcept
{
    return lockwarden::security::asStringView(lhs.secret) == lockwarden::security::asStringView(rhs.secret) &&
           lhs.updatedAt == rhs.updatedAt && lhs.category == rhs.category && lhs.extra == rhs.extra;
}

CredentialRecord migrateEntry(StoredEntry entry, const TimestampProvider& now)
{
    if (auto* legacy = std::get_if<LegacyEntry>(&entry))
    {
        CredentialRecord record{};
        record.secret = std::move(legacy->secret);
        record.updatedAt = now();
        return record;
    }

    auto record{ std::get<CredentialRecord>(std::move(entry)) };
    if (record.updatedAt.empty())
    {
        record.updatedAt = now();
    }
    return record;
}

bool CredentialCollection::empty() const noexcept
{
    return m_entries.empty();
}

std::size_t CredentialCollection::size() const noexcept
{
    return m_entries.size();
}

bool CredentialCollection::contains(std::string_view title) const
{
    return m_entries.find(title) != m_entries.end();
}

const CredentialRecord* CredentialCollection::find(std::string_view title) const
{
    const auto it{ m_entries.find(title) };
    return (it == m_entries.end()) ? nullptr : &it->second;
}

std::vector<std::string> CredentialCollection::titles() const
{
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (const auto& [title, record] : m_entries)
    {
        out.push_back(title);
    }
    return out;
}

const CredentialCollection::Entries& CredentialCollection::entries() const noexcept
{
    return m_entries;
}

void CredentialCollection::put(std::string title, CredentialRecord record)
{
    auto it{ m_entries.find(title) };
    if (it != m_entries.end())
    {
        lockwarden::security::secureRelease(it->second.secret);
        it->second = std::move(record);
        return;
    }
    m_entries.emplace(std::move(title), std::move(record));
}

bool CredentialCollection::erase(std::string_view title)
{
    auto it{ m_entries.find(title) };
    if (it == m_entries.end())
    {
        return false;
    }
    lockwarden::security::secureRelease(it->second.secret);
    m_entries.erase(it);
    return true;
}

void CredentialCollection::clear() noexcept
{
    for (auto& [title, record] : m_entries)
    {
        lockwarden::security::secureRelease(record.secret);
    }
    m_entries.clear();
}

lockwarden::security::SecureBuffer serializeCollection(const CredentialCollection& collection)
{
    Json doc = Json::object();
    for (const auto& [title, record] : collection.entries())
    {
        Json entry = Json::object();
        entry[std::string{ g_kPasswordKey }] = std::string{ lockwarden::security::asStringView(record.secret) };
        entry[std::string{ g_kUpdatedAtKey }] = record.updatedAt;
        if (record.category.has_value())
        {
            entry[std::string{ g_kCategoryKey }] = *record.category;
        }
        for (const auto& [key, value] : record.extra)
        {
            entry[key] = value;
        }
        doc[title] = std::move(entry);
    }

    std::string text{ doc.dump() };
    auto wipeText{ lockwarden::security::scopeWipe(text) };
    wipeJsonStrings(doc);

    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return lockwarden::security::SecureBuffer(text.begin(), text.end());
}

std::optional<CredentialCollection> deserializeCollection(std::span<const std::uint8_t> bytes,
                                                          const TimestampProvider& now)
{
    Json doc = Json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
    {
        return std::nullopt;
    }

    std::vector<std::pair<std::string, StoredEntry>> stored;
    stored.reserve(doc.size());
    for (const auto& [title, value] : doc.items())
    {
        stored.emplace_back(title, decodeEntry(value));
    }
    wipeJsonStrings(doc);

    CredentialCollection out{};
    for (auto& [title, entry] : stored)
    {
        out.put(title, migrateEntry(std::move(entry), now));
    }
    return out;
}

} // namespace lockwarden::core
