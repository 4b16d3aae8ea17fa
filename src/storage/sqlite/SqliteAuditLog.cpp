#include "lockwarden/storage/sqlite/SqliteAuditLogFactory.hpp"

#include "lockwarden/core/AuditLog.hpp"
#include "lockwarden/storage/sqlite/SqliteHandle.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace lockwarden::storage::sqlite
{
namespace
{

[[nodiscard]] std::string nowSeconds()
{
    const std::time_t now{ std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()) };
    std::tm local{};
    (void)localtime_r(&now, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS audit_log ("
             " id INTEGER PRIMARY KEY AUTOINCREMENT,"
             " username TEXT NOT NULL,"
             " recorded_at TEXT NOT NULL,"
             " action TEXT NOT NULL"
             ");"
             "CREATE INDEX IF NOT EXISTS audit_log_by_user ON audit_log(username, id);");
}

class SqliteAuditLog final : public lockwarden::core::IAuditLog
{
public:
    explicit SqliteAuditLog(const std::filesystem::path& path)
        : m_db(openDb(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX))
    {
        ensureSchema(m_db.get());
    }

    void record(std::string_view username, std::string_view action) override
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        Transaction tx{ m_db.get() };

        auto insert = prepare(m_db.get(), "INSERT INTO audit_log(username, recorded_at, action) VALUES (?, ?, ?);");
        bindText(m_db.get(), insert.get(), 1, username);
        bindText(m_db.get(), insert.get(), 2, nowSeconds());
        bindText(m_db.get(), insert.get(), 3, action);
        stepDone(m_db.get(), insert.get(), "audit: insert failed");

        auto prune = prepare(m_db.get(), "DELETE FROM audit_log WHERE username = ?1 AND id NOT IN ("
                                         " SELECT id FROM audit_log WHERE username = ?1 ORDER BY id DESC LIMIT ?2);");
        bindText(m_db.get(), prune.get(), 1, username);
        bindInt64(m_db.get(), prune.get(), 2, static_cast<std::int64_t>(lockwarden::core::g_auditEntriesPerUser));
        stepDone(m_db.get(), prune.get(), "audit: prune failed");

        tx.commit();
    }

    [[nodiscard]] std::vector<lockwarden::core::AuditEntry> recent(std::string_view username) const override
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        auto select = prepare(m_db.get(), "SELECT recorded_at, action FROM audit_log WHERE username = ?"
                                          " ORDER BY id DESC LIMIT ?;");
        bindText(m_db.get(), select.get(), 1, username);
        bindInt64(m_db.get(), select.get(), 2, static_cast<std::int64_t>(lockwarden::core::g_auditEntriesPerUser));

        std::vector<lockwarden::core::AuditEntry> out{};
        while (step(m_db.get(), select.get(), "audit: select failed"))
        {
            out.push_back(lockwarden::core::AuditEntry{ columnText(select.get(), 0), columnText(select.get(), 1) });
        }
        return out;
    }

private:
    mutable std::mutex m_mutex;
    SqliteDbPtr m_db;
};

} // namespace

std::unique_ptr<lockwarden::core::IAuditLog> makeSqliteAuditLog(const std::filesystem::path& path)
{
    return std::make_unique<SqliteAuditLog>(path);
}

} // namespace lockwarden::storage::sqlite
