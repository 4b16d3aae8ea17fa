#ifndef LOCKWARDEN_UI_CLI_INTERACTIVESHELL_HPP
#define LOCKWARDEN_UI_CLI_INTERACTIVESHELL_HPP

#include "lockwarden/core/AuditLog.hpp"
#include "lockwarden/core/CredentialProtocol.hpp"
#include "lockwarden/core/SessionLockController.hpp"
#include "lockwarden/security/PasswordGenerator.hpp"
#include "lockwarden/security/SecureString.hpp"

#include <functional>
#include <iostream>
#include <optional>
#include <string>

namespace lockwarden::ui::cli
{

// In tests: returns a pre-determined string.
using SecretReader = std::function<lockwarden::security::SecureString(const std::string&)>;

class InteractiveShell final
{
public:
    InteractiveShell(lockwarden::core::SessionLockController& controller,
                     lockwarden::core::CredentialProtocol& protocol, lockwarden::core::IAuditLog& audit,
                     std::istream& in, std::ostream& out, SecretReader secretReader);

    int run();

private:
    lockwarden::core::SessionLockController& m_controller;
    lockwarden::core::CredentialProtocol& m_protocol;
    lockwarden::core::IAuditLog& m_audit;
    std::istream& m_in;
    std::ostream& m_out;
    SecretReader m_secretReader;

    lockwarden::core::LockState m_lastSeen{ lockwarden::core::LockState::SignedOut };
    bool m_running{ true };

    void processLine(const std::string& line);
    void reportLockSinceLastCommand();
    void report(const lockwarden::core::AuthOutcome& outcome);

    void doRegister(const std::string& username);
    void doLogin(const std::string& username);
    void doCode(const std::string& code);
    void doCancel();
    void doUnlock();
    void doLock();
    void doLogout();
    void doList();
    void doGet(const std::string& title);
    void doPut(const std::string& title, const std::optional<std::string>& category,
               const std::optional<lockwarden::security::PasswordOptions>& generate);
    void doGenerate(const lockwarden::security::PasswordOptions& options);
    void doRm(const std::string& title);
    void doMfaEnable();
    void doMfaConfirm(const std::string& code);
    void doMfaDisable();
    void doHistory();
    void doStatus();
};

} // namespace lockwarden::ui::cli

#endif // LOCKWARDEN_UI_CLI_INTERACTIVESHELL_HPP
