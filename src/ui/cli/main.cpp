#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "lockwarden/authority/local/LocalAuthorityFactory.hpp"
#include "lockwarden/core/CredentialProtocol.hpp"
#include "lockwarden/core/SessionLockController.hpp"
#include "lockwarden/core/VaultCipher.hpp"
#include "lockwarden/crypto/providers/NativeProviderFactory.hpp"
#include "lockwarden/log/Log.hpp"
#include "lockwarden/storage/sqlite/SqliteAuditLogFactory.hpp"

#include <CLI/CLI.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    CLI::App app{ "Lockwarden: zero-knowledge password vault shell" };

    std::string authorityDb{ "lockwarden-authority.db" };
    std::string auditDb{ "lockwarden-audit.db" };
    unsigned int idleSeconds{ 300U };
    std::string logLevel{ "warning" };

    app.set_config("--config", "", "Read options from an INI file");
    app.add_option("--authority-db", authorityDb, "SQLite file of the local authority")->capture_default_str();
    app.add_option("--audit-db", auditDb, "SQLite file of the activity log")->capture_default_str();
    app.add_option("--idle-timeout", idleSeconds, "Seconds of inactivity before the vault locks; 0 disables")
        ->capture_default_str();
    app.add_option("--log-level", logLevel, "debug, info, warning, error or off")
        ->check(CLI::IsMember({ "debug", "info", "warning", "warn", "error", "off" }))
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    try
    {
        if (const auto level{ lockwarden::log::parseLevel(logLevel) })
        {
            lockwarden::log::setLevel(*level);
        }
        lockwarden::ui::cli::lockProcessMemory();

        lockwarden::authority::local::LocalAuthorityConfig authorityConfig{};
        authorityConfig.databasePath = authorityDb;
        auto authority{ lockwarden::authority::local::makeLocalAuthority(authorityConfig) };

        auto crypto{ lockwarden::crypto::providers::makeNativeCryptoProvider() };
        lockwarden::core::ProtocolConfig protocolConfig{};
        protocolConfig.baseUrl = authorityConfig.baseUrl;
        lockwarden::core::CredentialProtocol protocol{ protocolConfig, *authority, *crypto };
        lockwarden::core::VaultCipher cipher{ *crypto, protocolConfig.kdf };

        auto audit{ lockwarden::storage::sqlite::makeSqliteAuditLog(auditDb) };

        lockwarden::core::SessionConfig sessionConfig{};
        sessionConfig.idleTimeout = std::chrono::seconds{ idleSeconds };
        lockwarden::core::SessionLockController controller{ protocol, cipher, *audit, sessionConfig };

        lockwarden::ui::cli::InteractiveShell shell{ controller,
                                                     protocol,
                                                     *audit,
                                                     std::cin,
                                                     std::cout,
                                                     lockwarden::ui::cli::readSecret };
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
