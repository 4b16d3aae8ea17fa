#ifndef INCLUDE_LOCKWARDEN_STORAGE_SQLITE_SQLITEHANDLE_HPP
#define INCLUDE_LOCKWARDEN_STORAGE_SQLITE_SQLITEHANDLE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sqlite3.h>

// Thin RAII layer over the SQLite C API. Every failure throws std::runtime_error carrying sqlite3_errmsg.
namespace lockwarden::storage::sqlite
{

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix);

// ":memory:" opens a private in-memory database.
[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, int flags);

void exec(sqlite3* db, const char* sql);

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql);

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view text);
void bindInt64(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t value);
void bindBlob(sqlite3* db, sqlite3_stmt* stmt, int index, std::span<const std::uint8_t> bytes);

// Returns true for SQLITE_ROW, false for SQLITE_DONE.
[[nodiscard]] bool step(sqlite3* db, sqlite3_stmt* stmt, const char* what);
void stepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what);

[[nodiscard]] std::string columnText(sqlite3_stmt* stmt, int column);
[[nodiscard]] std::vector<std::uint8_t> columnBlob(sqlite3_stmt* stmt, int column);

// BEGIN IMMEDIATE on construction; rolls back on destruction unless committed.
class Transaction final
{
public:
    explicit Transaction(sqlite3* db);

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(Transaction&&) = delete;
    ~Transaction();

    void commit();

private:
    sqlite3* m_db{ nullptr };
    bool m_open{ false };
};

} // namespace lockwarden::storage::sqlite

#endif // INCLUDE_LOCKWARDEN_STORAGE_SQLITE_SQLITEHANDLE_HPP
