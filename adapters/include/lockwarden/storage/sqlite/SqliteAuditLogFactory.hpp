#ifndef INCLUDE_LOCKWARDEN_STORAGE_SQLITE_SQLITEAUDITLOGFACTORY_HPP
#define INCLUDE_LOCKWARDEN_STORAGE_SQLITE_SQLITEAUDITLOGFACTORY_HPP

#include "lockwarden/core/AuditLog.hpp"
#include <filesystem>
#include <memory>

namespace lockwarden::storage::sqlite
{

// Creates the database and its schema when missing. ":memory:" keeps the log for the process lifetime only.
[[nodiscard]] std::unique_ptr<lockwarden::core::IAuditLog> makeSqliteAuditLog(const std::filesystem::path& path);

} // namespace lockwarden::storage::sqlite

#endif // INCLUDE_LOCKWARDEN_STORAGE_SQLITE_SQLITEAUDITLOGFACTORY_HPP
