#ifndef INCLUDE_LOCKWARDEN_CORE_AUDITLOG_HPP
#define INCLUDE_LOCKWARDEN_CORE_AUDITLOG_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lockwarden::core
{

constexpr std::size_t g_auditEntriesPerUser{ 100 };

struct AuditEntry final
{
    std::string timestamp; // "YYYY-MM-DD HH:MM:SS"
    std::string action;
};

// Per-user record of security-relevant events. Actions never contain secrets.
class IAuditLog
{
public:
    IAuditLog() = default;
    IAuditLog(const IAuditLog&) = delete;
    IAuditLog& operator=(const IAuditLog&) = delete;
    IAuditLog(IAuditLog&&) = delete;
    IAuditLog& operator=(IAuditLog&&) = delete;
    virtual ~IAuditLog() = default;

    // Keeps at most g_auditEntriesPerUser entries per user; storage failures throw std::runtime_error.
    virtual void record(std::string_view username, std::string_view action) = 0;

    // Newest first.
    [[nodiscard]] virtual std::vector<AuditEntry> recent(std::string_view username) const = 0;
};

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_AUDITLOG_HPP
