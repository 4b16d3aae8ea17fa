#include "AccountStore.hpp"

namespace lockwarden::authority::local
{

namespace sql = lockwarden::storage::sqlite;

namespace
{

void ensureSchema(sqlite3* db)
{
    sql::exec(db, "CREATE TABLE IF NOT EXISTS accounts ("
                  " username TEXT PRIMARY KEY,"
                  " salt BLOB NOT NULL,"
                  " verifier BLOB NOT NULL,"
                  " mfa_secret TEXT,"
                  " mfa_enabled INTEGER NOT NULL DEFAULT 0,"
                  " vault TEXT"
                  ");"
                  "CREATE TABLE IF NOT EXISTS recovery_codes ("
                  " username TEXT NOT NULL,"
                  " code TEXT NOT NULL,"
                  " used INTEGER NOT NULL DEFAULT 0,"
                  " PRIMARY KEY(username, code)"
                  ");");
}

} // namespace

AccountStore::AccountStore(const std::filesystem::path& path)
    : m_db(sql::openDb(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE))
{
    ensureSchema(m_db.get());
}

bool AccountStore::create(std::string_view username, std::span<const std::uint8_t> salt,
                          std::span<const std::uint8_t> verifier)
{
    auto stmt = sql::prepare(m_db.get(), "INSERT OR IGNORE INTO accounts(username, salt, verifier) VALUES (?, ?, ?);");
    sql::bindText(m_db.get(), stmt.get(), 1, username);
    sql::bindBlob(m_db.get(), stmt.get(), 2, salt);
    sql::bindBlob(m_db.get(), stmt.get(), 3, verifier);
    sql::stepDone(m_db.get(), stmt.get(), "authority: insert account failed");
    return sqlite3_changes(m_db.get()) == 1;
}

std::optional<AccountRecord> AccountStore::find(std::string_view username) const
{
    auto stmt = sql::prepare(m_db.get(), "SELECT salt, verifier, mfa_secret, mfa_enabled, vault"
                                         " FROM accounts WHERE username = ?;");
    sql::bindText(m_db.get(), stmt.get(), 1, username);
    if (!sql::step(m_db.get(), stmt.get(), "authority: select account failed"))
    {
        return std::nullopt;
    }

    AccountRecord out{};
    out.username = std::string{ username };
    out.salt = sql::columnBlob(stmt.get(), 0);
    out.verifier = sql::columnBlob(stmt.get(), 1);
    if (sqlite3_column_type(stmt.get(), 2) != SQLITE_NULL)
    {
        out.mfaSecret = sql::columnText(stmt.get(), 2);
    }
    out.mfaEnabled = sqlite3_column_int(stmt.get(), 3) != 0;
    if (sqlite3_column_type(stmt.get(), 4) != SQLITE_NULL)
    {
        out.vault = sql::columnText(stmt.get(), 4);
    }
    return out;
}

void AccountStore::beginSecondFactor(std::string_view username, std::string_view base32Secret,
                                     const std::vector<std::string>& recoveryCodes)
{
    sql::Transaction tx{ m_db.get() };

    auto update = sql::prepare(m_db.get(), "UPDATE accounts SET mfa_secret = ?, mfa_enabled = 0 WHERE username = ?;");
    sql::bindText(m_db.get(), update.get(), 1, base32Secret);
    sql::bindText(m_db.get(), update.get(), 2, username);
    sql::stepDone(m_db.get(), update.get(), "authority: store second factor failed");

    auto clear = sql::prepare(m_db.get(), "DELETE FROM recovery_codes WHERE username = ?;");
    sql::bindText(m_db.get(), clear.get(), 1, username);
    sql::stepDone(m_db.get(), clear.get(), "authority: clear recovery codes failed");

    for (const auto& code : recoveryCodes)
    {
        auto insert = sql::prepare(m_db.get(), "INSERT INTO recovery_codes(username, code) VALUES (?, ?);");
        sql::bindText(m_db.get(), insert.get(), 1, username);
        sql::bindText(m_db.get(), insert.get(), 2, code);
        sql::stepDone(m_db.get(), insert.get(), "authority: insert recovery code failed");
    }

    tx.commit();
}

void AccountStore::enableSecondFactor(std::string_view username)
{
    auto stmt = sql::prepare(m_db.get(), "UPDATE accounts SET mfa_enabled = 1 WHERE username = ?;");
    sql::bindText(m_db.get(), stmt.get(), 1, username);
    sql::stepDone(m_db.get(), stmt.get(), "authority: enable second factor failed");
}

void AccountStore::disableSecondFactor(std::string_view username)
{
    sql::Transaction tx{ m_db.get() };

    auto update =
        sql::prepare(m_db.get(), "UPDATE accounts SET mfa_secret = NULL, mfa_enabled = 0 WHERE username = ?;");
    sql::bindText(m_db.get(), update.get(), 1, username);
    sql::stepDone(m_db.get(), update.get(), "authority: disable second factor failed");

    auto clear = sql::prepare(m_db.get(), "DELETE FROM recovery_codes WHERE username = ?;");
    sql::bindText(m_db.get(), clear.get(), 1, username);
    sql::stepDone(m_db.get(), clear.get(), "authority: clear recovery codes failed");

    tx.commit();
}

bool AccountStore::consumeRecoveryCode(std::string_view username, std::string_view code)
{
    auto stmt = sql::prepare(m_db.get(), "UPDATE recovery_codes SET used = 1"
                                         " WHERE username = ? AND code = ? AND used = 0;");
    sql::bindText(m_db.get(), stmt.get(), 1, username);
    sql::bindText(m_db.get(), stmt.get(), 2, code);
    sql::stepDone(m_db.get(), stmt.get(), "authority: consume recovery code failed");
    return sqlite3_changes(m_db.get()) == 1;
}

void AccountStore::storeVault(std::string_view username, std::string_view sealedJson)
{
    auto stmt = sql::prepare(m_db.get(), "UPDATE accounts SET vault = ? WHERE username = ?;");
    sql::bindText(m_db.get(), stmt.get(), 1, sealedJson);
    sql::bindText(m_db.get(), stmt.get(), 2, username);
    sql::stepDone(m_db.get(), stmt.get(), "authority: store vault failed");
}

} // namespace lockwarden::authority::local
