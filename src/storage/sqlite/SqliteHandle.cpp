#include "lockwarden/storage/sqlite/SqliteHandle.hpp"

#include <cstring>
#include <stdexcept>

namespace lockwarden::storage::sqlite
{

std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

SqliteDbPtr openDb(const std::filesystem::path& path, int flags)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw std::runtime_error(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    (void)sqlite3_busy_timeout(db.get(), 2000);
    return db;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw std::runtime_error(msg);
    }
}

SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw std::runtime_error(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view text)
{
    if (sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "storage: bind text failed"));
    }
}

void bindInt64(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t value)
{
    if (sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "storage: bind integer failed"));
    }
}

void bindBlob(sqlite3* db, sqlite3_stmt* stmt, int index, std::span<const std::uint8_t> bytes)
{
    // A zero-length blob still needs a non-null pointer or SQLite stores NULL.
    static constexpr std::uint8_t g_kEmpty{ 0 };
    const void* data = bytes.empty() ? static_cast<const void*>(&g_kEmpty) : bytes.data();
    if (sqlite3_bind_blob(stmt, index, data, static_cast<int>(bytes.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "storage: bind blob failed"));
    }
}

bool step(sqlite3* db, sqlite3_stmt* stmt, const char* what)
{
    const int stepRc = sqlite3_step(stmt);
    if (stepRc == SQLITE_ROW)
    {
        return true;
    }
    if (stepRc == SQLITE_DONE)
    {
        return false;
    }
    throw std::runtime_error(sqliteErr(db, what));
}

void stepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE)
    {
        throw std::runtime_error(sqliteErr(db, what));
    }
}

std::string columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = sqlite3_column_text(stmt, column);
    const int bytes = sqlite3_column_bytes(stmt, column);
    if (text == nullptr || bytes <= 0)
    {
        return {};
    }
    return std::string{ reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes) };
}

std::vector<std::uint8_t> columnBlob(sqlite3_stmt* stmt, int column)
{
    const void* ptr = sqlite3_column_blob(stmt, column);
    const int bytes = sqlite3_column_bytes(stmt, column);
    std::vector<std::uint8_t> out{};
    if (ptr == nullptr || bytes <= 0)
    {
        return out;
    }
    out.resize(static_cast<std::size_t>(bytes));
    std::memcpy(out.data(), ptr, out.size());
    return out;
}

Transaction::Transaction(sqlite3* db) : m_db(db)
{
    exec(m_db, "BEGIN IMMEDIATE;");
    m_open = true;
}

Transaction::~Transaction()
{
    if (m_open)
    {
        (void)sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit()
{
    exec(m_db, "COMMIT;");
    m_open = false;
}

} // namespace lockwarden::storage::sqlite
