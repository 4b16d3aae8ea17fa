#ifndef LOCKWARDEN_AUTHORITY_LOCAL_ACCOUNTSTORE_HPP
#define LOCKWARDEN_AUTHORITY_LOCAL_ACCOUNTSTORE_HPP

#include "lockwarden/storage/sqlite/SqliteHandle.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lockwarden::authority::local
{

struct AccountRecord final
{
    std::string username;
    std::vector<std::uint8_t> salt;
    std::vector<std::uint8_t> verifier;
    std::optional<std::string> mfaSecret; // base32; present once enrollment started
    bool mfaEnabled{ false };
    std::optional<std::string> vault; // sealed vault JSON, opaque to the authority
};

// SQLite persistence for the local authority. Not thread-safe; the authority serializes access.
class AccountStore final
{
public:
    explicit AccountStore(const std::filesystem::path& path);

    // false when the username already exists.
    [[nodiscard]] bool create(std::string_view username, std::span<const std::uint8_t> salt,
                              std::span<const std::uint8_t> verifier);
    [[nodiscard]] std::optional<AccountRecord> find(std::string_view username) const;

    // Replaces any earlier pending or active enrollment; the second factor stays disabled until enabled.
    void beginSecondFactor(std::string_view username, std::string_view base32Secret,
                           const std::vector<std::string>& recoveryCodes);
    void enableSecondFactor(std::string_view username);
    void disableSecondFactor(std::string_view username);

    // Marks the code used; false when unknown or already used.
    [[nodiscard]] bool consumeRecoveryCode(std::string_view username, std::string_view code);

    void storeVault(std::string_view username, std::string_view sealedJson);

private:
    lockwarden::storage::sqlite::SqliteDbPtr m_db;
};

} // namespace lockwarden::authority::local

#endif // LOCKWARDEN_AUTHORITY_LOCAL_ACCOUNTSTORE_HPP
