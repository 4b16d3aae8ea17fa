#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "lockwarden/core/CredentialCollection.hpp"
#include "test_utils/Harness.hpp"

namespace
{

using lockwarden::core::CredentialCollection;
using lockwarden::core::CredentialRecord;
using lockwarden::security::secureStringFrom;
using lockwarden::test_utils::fixedTimestamp;
using lockwarden::test_utils::g_kFixedTimestamp;

[[nodiscard]] CredentialRecord record(std::string_view secret, std::string updatedAt,
                                      std::optional<std::string> category = std::nullopt)
{
    CredentialRecord out{};
    out.secret = secureStringFrom(secret);
    out.updatedAt = std::move(updatedAt);
    out.category = std::move(category);
    return out;
}

[[nodiscard]] std::span<const std::uint8_t> bytesOf(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

[[nodiscard]] std::string textOf(const lockwarden::security::SecureBuffer& buffer)
{
    return { buffer.begin(), buffer.end() };
}

} // namespace

TEST(CredentialCollection, PutReplacesByTitle)
{
    CredentialCollection collection{};
    collection.put("github", record("first", "2024-01-01 00:00"));
    collection.put("github", record("second", "2024-01-02 00:00", "dev"));

    ASSERT_EQ(collection.size(), 1U);
    const auto* entry{ collection.find("github") };
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(lockwarden::security::asStringView(entry->secret), "second");
    EXPECT_EQ(entry->category, "dev");
}

TEST(CredentialCollection, EraseReportsMissingTitles)
{
    CredentialCollection collection{};
    collection.put("mail", record("pw", "2024-01-01 00:00"));

    EXPECT_FALSE(collection.erase("bank"));
    EXPECT_TRUE(collection.erase("mail"));
    EXPECT_TRUE(collection.empty());
    EXPECT_EQ(collection.find("mail"), nullptr);
}

TEST(CredentialCollection, TitlesAreSorted)
{
    CredentialCollection collection{};
    collection.put("zeta", record("1", "t"));
    collection.put("alpha", record("2", "t"));
    collection.put("mid", record("3", "t"));

    EXPECT_THAT(collection.titles(), ::testing::ElementsAre("alpha", "mid", "zeta"));
}

TEST(CredentialCollection, SerializesCanonically)
{
    CredentialCollection collection{};
    collection.put("mail", record("pw", "2024-05-06 07:08", "work"));
    auto plain{ record("x", "2024-05-06 07:09") };
    plain.extra.emplace("username", "alice");
    collection.put("bank", std::move(plain));

    EXPECT_EQ(textOf(lockwarden::core::serializeCollection(collection)),
              R"({"bank":{"password":"x","updatedAt":"2024-05-06 07:09","username":"alice"},)"
              R"("mail":{"category":"work","password":"pw","updatedAt":"2024-05-06 07:08"}})");
}

TEST(CredentialCollection, StructuredEntriesSurviveSerialization)
{
    CredentialCollection collection{};
    auto entry{ record("s3cr3t", "2024-05-06 07:08", "finance") };
    entry.extra.emplace("url", "https://bank.example");
    collection.put("bank", std::move(entry));

    const auto bytes{ lockwarden::core::serializeCollection(collection) };
    const auto parsed{ lockwarden::core::deserializeCollection(bytes, fixedTimestamp()) };

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, collection);
}

TEST(CredentialCollection, MigratesLegacyScalarEntries)
{
    const auto parsed{ lockwarden::core::deserializeCollection(
        bytesOf(R"({"github":"hunter2","pin":1234,"mail":{"password":"pw","updatedAt":"2023-12-31 23:59"}})"),
        fixedTimestamp()) };

    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 3U);

    const auto* github{ parsed->find("github") };
    ASSERT_NE(github, nullptr);
    EXPECT_EQ(lockwarden::security::asStringView(github->secret), "hunter2");
    EXPECT_EQ(github->updatedAt, g_kFixedTimestamp);
    EXPECT_FALSE(github->category.has_value());

    const auto* pin{ parsed->find("pin") };
    ASSERT_NE(pin, nullptr);
    EXPECT_EQ(lockwarden::security::asStringView(pin->secret), "1234");

    const auto* mail{ parsed->find("mail") };
    ASSERT_NE(mail, nullptr);
    EXPECT_EQ(mail->updatedAt, "2023-12-31 23:59");
}

TEST(CredentialCollection, MissingTimestampIsSynthesized)
{
    const auto parsed{ lockwarden::core::deserializeCollection(bytesOf(R"({"wifi":{"password":"p"}})"),
                                                               fixedTimestamp()) };
    ASSERT_TRUE(parsed.has_value());
    ASSERT_NE(parsed->find("wifi"), nullptr);
    EXPECT_EQ(parsed->find("wifi")->updatedAt, g_kFixedTimestamp);
}

TEST(CredentialCollection, RejectsNonObjectDocuments)
{
    EXPECT_FALSE(lockwarden::core::deserializeCollection(bytesOf("[1,2]"), fixedTimestamp()).has_value());
    EXPECT_FALSE(lockwarden::core::deserializeCollection(bytesOf("not json"), fixedTimestamp()).has_value());
    EXPECT_FALSE(lockwarden::core::deserializeCollection(bytesOf(""), fixedTimestamp()).has_value());
}

TEST(CredentialCollection, MigrateEntryKeepsExistingTimestamp)
{
    auto migrated{ lockwarden::core::migrateEntry(record("pw", "2020-02-02 02:02"), fixedTimestamp()) };
    EXPECT_EQ(migrated.updatedAt, "2020-02-02 02:02");

    auto legacy{ lockwarden::core::migrateEntry(lockwarden::core::LegacyEntry{ secureStringFrom("old") },
                                                fixedTimestamp()) };
    EXPECT_EQ(lockwarden::security::asStringView(legacy.secret), "old");
    EXPECT_EQ(legacy.updatedAt, g_kFixedTimestamp);
}

TEST(CredentialCollection, CurrentTimestampHasMinutePrecision)
{
    const auto stamp{ lockwarden::core::currentTimestamp() };
    ASSERT_EQ(stamp.size(), 16U);
    EXPECT_EQ(stamp[4], '-');
    EXPECT_EQ(stamp[10], ' ');
    EXPECT_EQ(stamp[13], ':');
}
