#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>

#include "lockwarden/authority/local/Totp.hpp"
#include "lockwarden/core/CredentialProtocol.hpp"
#include "lockwarden/security/SecureString.hpp"
#include "test_utils/Harness.hpp"

namespace
{

using namespace lockwarden::core;
using lockwarden::security::secureStringFrom;
using lockwarden::test_utils::g_kFastKdf;
using lockwarden::test_utils::Harness;

class CredentialProtocolTest : public ::testing::Test
{
protected:
    Harness m_env;

    void registerOrFail(std::string_view username, std::string_view secret)
    {
        const auto result{ m_env.protocol.registerAccount(username, secureStringFrom(secret)) };
        ASSERT_TRUE(std::holds_alternative<std::monostate>(result));
    }

    [[nodiscard]] SessionToken loginOrFail(std::string_view username, std::string_view secret)
    {
        auto result{ m_env.protocol.login(username, secureStringFrom(secret)) };
        if (!std::holds_alternative<SessionToken>(result))
        {
            ADD_FAILURE() << "login did not return a token (index " << result.index() << ")";
            return {};
        }
        return std::get<SessionToken>(std::move(result));
    }

    [[nodiscard]] std::string currentCode(const SecondFactorEnrollment& enrollment) const
    {
        const auto key{ lockwarden::authority::local::base32Decode(
            lockwarden::security::asStringView(enrollment.sharedSecret)) };
        if (!key)
        {
            ADD_FAILURE() << "shared secret is not base32";
            return {};
        }
        return lockwarden::authority::local::computeTotp(std::span<const std::uint8_t>{ *key },
                                                         m_env.clock->load());
    }

    [[nodiscard]] SecondFactorEnrollment enableSecondFactor(std::string_view username, std::string_view secret)
    {
        const auto token{ loginOrFail(username, secret) };
        auto enrolled{ m_env.protocol.enrollSecondFactor(token) };
        if (!std::holds_alternative<SecondFactorEnrollment>(enrolled))
        {
            ADD_FAILURE() << "enrollment failed";
            return {};
        }
        auto enrollment{ std::get<SecondFactorEnrollment>(std::move(enrolled)) };
        const auto verified{ m_env.protocol.verifySecondFactor(username, currentCode(enrollment)) };
        EXPECT_TRUE(std::holds_alternative<bool>(verified) && std::get<bool>(verified));
        return enrollment;
    }
};

[[nodiscard]] std::string withWrongLastDigit(std::string code)
{
    if (!code.empty())
    {
        code.back() = code.back() == '0' ? '1' : '0';
    }
    return code;
}

} // namespace

TEST_F(CredentialProtocolTest, RegisteredAccountCanLogIn)
{
    registerOrFail("alice", "Secret123!");

    const auto salt{ m_env.protocol.lookupSalt("alice") };
    ASSERT_TRUE(std::holds_alternative<AuthSalt>(salt));

    const auto token{ loginOrFail("alice", "Secret123!") };
    EXPECT_FALSE(token.value.empty());
}

TEST_F(CredentialProtocolTest, UnknownUserIsNotFound)
{
    EXPECT_TRUE(std::holds_alternative<NotFound>(m_env.protocol.lookupSalt("nobody")));
    EXPECT_TRUE(std::holds_alternative<NotFound>(m_env.protocol.login("nobody", secureStringFrom("x"))));
    EXPECT_TRUE(std::holds_alternative<NotFound>(m_env.protocol.mfaStatus("nobody")));
}

TEST_F(CredentialProtocolTest, UsernamesAreEscapedInPaths)
{
    registerOrFail("a b/c?d", "Secret123!");
    EXPECT_TRUE(std::holds_alternative<AuthSalt>(m_env.protocol.lookupSalt("a b/c?d")));
    EXPECT_TRUE(std::holds_alternative<NotFound>(m_env.protocol.lookupSalt("a b")));
}

TEST_F(CredentialProtocolTest, WrongSecretIsInvalidCredentials)
{
    registerOrFail("alice", "Secret123!");
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(m_env.protocol.login("alice", secureStringFrom("nope"))));
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(m_env.protocol.login("alice", secureStringFrom(""))));
}

TEST_F(CredentialProtocolTest, DuplicateRegistrationIsUsernameTaken)
{
    registerOrFail("alice", "Secret123!");
    const auto again{ m_env.protocol.registerAccount("alice", secureStringFrom("Other456?")) };
    EXPECT_TRUE(std::holds_alternative<UsernameTaken>(again));

    // The first registration still owns the account.
    (void)loginOrFail("alice", "Secret123!");
}

TEST_F(CredentialProtocolTest, RegisterRejectsEmptyInput)
{
    EXPECT_TRUE(std::holds_alternative<RejectedInput>(m_env.protocol.registerAccount("", secureStringFrom("x"))));
    EXPECT_TRUE(std::holds_alternative<RejectedInput>(m_env.protocol.registerAccount("alice", secureStringFrom(""))));

    // Nothing reached the authority.
    EXPECT_TRUE(std::holds_alternative<NotFound>(m_env.protocol.lookupSalt("alice")));
}

TEST_F(CredentialProtocolTest, UnreachableAuthorityIsNetworkError)
{
    CredentialProtocol offline{ ProtocolConfig{ .baseUrl = "local://elsewhere", .kdf = g_kFastKdf }, m_env.transport,
                                *m_env.crypto };

    const auto salt{ offline.lookupSalt("alice") };
    ASSERT_TRUE(std::holds_alternative<NetworkError>(salt));
    EXPECT_FALSE(std::get<NetworkError>(salt).detail.empty());
    EXPECT_TRUE(std::holds_alternative<NetworkError>(offline.login("alice", secureStringFrom("x"))));
    EXPECT_TRUE(std::holds_alternative<NetworkError>(offline.registerAccount("alice", secureStringFrom("x"))));
}

TEST_F(CredentialProtocolTest, RepeatedFailuresAreRateLimited)
{
    registerOrFail("alice", "Secret123!");
    for (int i = 0; i < 5; ++i)
    {
        EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(m_env.protocol.login("alice", secureStringFrom("bad"))));
    }

    const auto limited{ m_env.protocol.login("alice", secureStringFrom("bad")) };
    ASSERT_TRUE(std::holds_alternative<RateLimited>(limited));
    EXPECT_EQ(std::get<RateLimited>(limited).retryAfter, std::chrono::seconds{ 30 });
    EXPECT_NE(std::get<RateLimited>(limited).detail.find("30"), std::string::npos);

    // The right secret does not bypass the block.
    EXPECT_TRUE(
        std::holds_alternative<RateLimited>(m_env.protocol.login("alice", secureStringFrom("Secret123!"))));

    m_env.clock->fetch_add(10U);
    const auto shorter{ m_env.protocol.login("alice", secureStringFrom("Secret123!")) };
    ASSERT_TRUE(std::holds_alternative<RateLimited>(shorter));
    EXPECT_EQ(std::get<RateLimited>(shorter).retryAfter, std::chrono::seconds{ 20 });

    m_env.clock->fetch_add(20U);
    (void)loginOrFail("alice", "Secret123!");
}

TEST_F(CredentialProtocolTest, VaultStartsEmptyAndStoresWholesale)
{
    registerOrFail("alice", "Secret123!");
    const auto token{ loginOrFail("alice", "Secret123!") };

    const auto empty{ m_env.protocol.fetchVault(token) };
    ASSERT_TRUE(std::holds_alternative<std::optional<SealedVault>>(empty));
    EXPECT_FALSE(std::get<std::optional<SealedVault>>(empty).has_value());

    CredentialCollection collection{};
    collection.put("mail", CredentialRecord{ .secret = secureStringFrom("pw"), .updatedAt = "2024-01-02 03:04" });
    auto sealed{ m_env.cipher.seal(collection, secureStringFrom("Secret123!")) };
    ASSERT_TRUE(std::holds_alternative<SealedVault>(sealed));

    const auto stored{ m_env.protocol.storeVault(token, std::get<SealedVault>(sealed)) };
    ASSERT_TRUE(std::holds_alternative<std::monostate>(stored));

    const auto fetched{ m_env.protocol.fetchVault(token) };
    ASSERT_TRUE(std::holds_alternative<std::optional<SealedVault>>(fetched));
    const auto& blob{ std::get<std::optional<SealedVault>>(fetched) };
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(*blob, std::get<SealedVault>(sealed));
}

TEST_F(CredentialProtocolTest, UnknownTokenCannotTouchVault)
{
    const SessionToken forged{ "00" };
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(m_env.protocol.fetchVault(forged)));
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(m_env.protocol.storeVault(forged, SealedVault{})));
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(m_env.protocol.enrollSecondFactor(forged)));
}

TEST_F(CredentialProtocolTest, SecondFactorEnrollmentReturnsMaterial)
{
    registerOrFail("alice", "Secret123!");
    const auto token{ loginOrFail("alice", "Secret123!") };

    const auto enrolled{ m_env.protocol.enrollSecondFactor(token) };
    ASSERT_TRUE(std::holds_alternative<SecondFactorEnrollment>(enrolled));
    const auto& enrollment{ std::get<SecondFactorEnrollment>(enrolled) };
    EXPECT_EQ(enrollment.sharedSecret.size(), 32U);
    EXPECT_TRUE(enrollment.provisioningUri.starts_with("otpauth://totp/Lockwarden:alice?secret="));
    ASSERT_EQ(enrollment.recoveryCodes.size(), 8U);
    EXPECT_EQ(enrollment.recoveryCodes.front().size(), 9U);
    EXPECT_EQ(enrollment.recoveryCodes.front()[4], '-');

    // Not enabled until a code is confirmed.
    const auto status{ m_env.protocol.mfaStatus("alice") };
    ASSERT_TRUE(std::holds_alternative<bool>(status));
    EXPECT_FALSE(std::get<bool>(status));

    const auto rejected{ m_env.protocol.verifySecondFactor("alice", withWrongLastDigit(currentCode(enrollment))) };
    ASSERT_TRUE(std::holds_alternative<bool>(rejected));
    EXPECT_FALSE(std::get<bool>(rejected));
}

TEST_F(CredentialProtocolTest, SecondFactorGatesLoginAndVault)
{
    registerOrFail("alice", "Secret123!");
    const auto enrollment{ enableSecondFactor("alice", "Secret123!") };

    const auto status{ m_env.protocol.mfaStatus("alice") };
    ASSERT_TRUE(std::holds_alternative<bool>(status));
    EXPECT_TRUE(std::get<bool>(status));

    // A plain login still verifies the secret, but its token cannot reach the vault.
    const auto restricted{ loginOrFail("alice", "Secret123!") };
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(m_env.protocol.fetchVault(restricted)));

    const auto badCode{ m_env.protocol.loginWithSecondFactor("alice", secureStringFrom("Secret123!"),
                                                             withWrongLastDigit(currentCode(enrollment))) };
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(badCode));

    const auto badSecret{ m_env.protocol.loginWithSecondFactor("alice", secureStringFrom("nope"),
                                                               currentCode(enrollment)) };
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(badSecret));

    const auto full{ m_env.protocol.loginWithSecondFactor("alice", secureStringFrom("Secret123!"),
                                                          currentCode(enrollment)) };
    ASSERT_TRUE(std::holds_alternative<SessionToken>(full));
    EXPECT_TRUE(std::holds_alternative<std::optional<SealedVault>>(
        m_env.protocol.fetchVault(std::get<SessionToken>(full))));
}

TEST_F(CredentialProtocolTest, RecoveryCodeWorksOnce)
{
    registerOrFail("alice", "Secret123!");
    const auto enrollment{ enableSecondFactor("alice", "Secret123!") };
    const std::string recovery{ lockwarden::security::asStringView(enrollment.recoveryCodes.at(2)) };

    const auto first{ m_env.protocol.loginWithSecondFactor("alice", secureStringFrom("Secret123!"), recovery) };
    EXPECT_TRUE(std::holds_alternative<SessionToken>(first));

    const auto second{ m_env.protocol.loginWithSecondFactor("alice", secureStringFrom("Secret123!"), recovery) };
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(second));
}

TEST_F(CredentialProtocolTest, SecondFactorLoginWithoutEnrollmentIsRejected)
{
    registerOrFail("alice", "Secret123!");
    const auto result{ m_env.protocol.loginWithSecondFactor("alice", secureStringFrom("Secret123!"), "123456") };
    EXPECT_TRUE(std::holds_alternative<InvalidCredentials>(result));
}

TEST_F(CredentialProtocolTest, DisableNeedsFullToken)
{
    registerOrFail("alice", "Secret123!");
    const auto enrollment{ enableSecondFactor("alice", "Secret123!") };

    const auto restricted{ loginOrFail("alice", "Secret123!") };
    const auto refused{ m_env.protocol.disableSecondFactor(restricted) };
    ASSERT_TRUE(std::holds_alternative<bool>(refused));
    EXPECT_FALSE(std::get<bool>(refused));

    const auto full{ m_env.protocol.loginWithSecondFactor("alice", secureStringFrom("Secret123!"),
                                                          currentCode(enrollment)) };
    ASSERT_TRUE(std::holds_alternative<SessionToken>(full));
    const auto disabled{ m_env.protocol.disableSecondFactor(std::get<SessionToken>(full)) };
    ASSERT_TRUE(std::holds_alternative<bool>(disabled));
    EXPECT_TRUE(std::get<bool>(disabled));

    const auto status{ m_env.protocol.mfaStatus("alice") };
    ASSERT_TRUE(std::holds_alternative<bool>(status));
    EXPECT_FALSE(std::get<bool>(status));
}
