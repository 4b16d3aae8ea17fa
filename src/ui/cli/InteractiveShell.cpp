#include "InteractiveShell.hpp"
#include "Tokenizer.hpp"
#include "lockwarden/log/Log.hpp"
#include "lockwarden/security/PasswordGenerator.hpp"
#include "lockwarden/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

namespace lockwarden::ui::cli
{

namespace
{

namespace core = lockwarden::core;

[[nodiscard]] std::string describe(const std::monostate&)
{
    return "OK.";
}

[[nodiscard]] std::string describe(const core::MfaRequired&)
{
    return "Second factor required. Enter 'code <digits>' or 'cancel'.";
}

[[nodiscard]] std::string describe(const core::NotFound&)
{
    return "Error: No such account. Use 'register' first.";
}

// Wrong secret and undecryptable vault read the same to the user.
[[nodiscard]] std::string describe(const core::InvalidCredentials&)
{
    return "Error: Invalid credentials.";
}

[[nodiscard]] std::string describe(const core::DecryptionFailure&)
{
    return "Error: Invalid credentials.";
}

[[nodiscard]] std::string describe(const core::RateLimited& limited)
{
    return "Error: Too many attempts. Try again in " + std::to_string(limited.retryAfter.count()) + " seconds.";
}

[[nodiscard]] std::string describe(const core::NetworkError& failure)
{
    return "Error: Network failure (" + failure.detail + ").";
}

[[nodiscard]] std::string describe(const core::ProtocolError& failure)
{
    return "Error: Unexpected response from the server (" + failure.detail + ").";
}

[[nodiscard]] std::string describe(const core::VaultError&)
{
    return "Error: Vault encryption failed.";
}

[[nodiscard]] std::string describe(const core::Superseded&)
{
    return "Error: A newer attempt replaced this one.";
}

[[nodiscard]] std::string describe(const core::NotPermitted&)
{
    return "Error: Not available in the current state.";
}

[[nodiscard]] std::string describe(const core::UsernameTaken&)
{
    return "Error: Username already taken.";
}

[[nodiscard]] std::string describe(const core::RejectedInput& rejected)
{
    return "Error: Invalid input (" + rejected.detail + ").";
}

template <class Variant> [[nodiscard]] std::string describeOutcome(const Variant& outcome)
{
    return std::visit([](const auto& alternative) { return describe(alternative); }, outcome);
}

} // namespace

InteractiveShell::InteractiveShell(core::SessionLockController& controller, core::CredentialProtocol& protocol,
                                   core::IAuditLog& audit, std::istream& in, std::ostream& out,
                                   SecretReader secretReader)
    : m_controller(controller), m_protocol(protocol), m_audit(audit), m_in(in), m_out(out),
      m_secretReader(std::move(secretReader)), m_lastSeen(controller.state())
{
}

int InteractiveShell::run()
{
    m_out << "Lockwarden shell\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        const auto user{ m_controller.username() };
        if (user.empty())
        {
            m_out << "lockwarden> ";
        }
        else
        {
            m_out << "lockwarden(" << user << ", " << core::toString(m_controller.state()) << ")> ";
        }

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        reportLockSinceLastCommand();
        if (line.empty())
        {
            continue;
        }

        m_controller.post(core::HostEvent::Activity);
        processLine(line);
        m_lastSeen = m_controller.state();
    }
    return 0;
}

void InteractiveShell::reportLockSinceLastCommand()
{
    const auto current{ m_controller.state() };
    if (m_lastSeen == core::LockState::Unlocked && current == core::LockState::Locked)
    {
        m_out << "Session locked after inactivity. Use 'unlock' to continue.\n";
    }
    m_lastSeen = current;
}

void InteractiveShell::processLine(const std::string& line)
{
    auto words{ tokenize(line) };
    if (!words)
    {
        m_out << "Syntax Error: unterminated quote\n";
        return;
    }
    std::vector<std::string> userArgs{ std::move(*words) };
    if (userArgs.empty())
    {
        return;
    }

    // 'help' prints the root help rather than the help subcommand's own.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("lockwarden");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "Lockwarden shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });

    std::string nameArg;
    auto* subRegister = app.add_subcommand("register", "Create an account (prompts for a password)");
    subRegister->add_option("username", nameArg, "Account name")->required();
    subRegister->callback([&]() { doRegister(nameArg); });

    auto* subLogin = app.add_subcommand("login", "Sign in and open the vault");
    subLogin->add_option("username", nameArg, "Account name")->required();
    subLogin->callback([&]() { doLogin(nameArg); });

    std::string codeArg;
    auto* subCode = app.add_subcommand("code", "Submit a second-factor or recovery code");
    subCode->add_option("code", codeArg, "Code from the authenticator")->required();
    subCode->callback([&]() { doCode(codeArg); });

    app.add_subcommand("cancel", "Abandon the pending second-factor step")->callback([this]() { doCancel(); });
    app.add_subcommand("unlock", "Unlock a locked session")->callback([this]() { doUnlock(); });
    app.add_subcommand("lock", "Lock the session now")->callback([this]() { doLock(); });
    app.add_subcommand("logout", "Sign out and discard the session")->callback([this]() { doLogout(); });
    app.add_subcommand("ls", "List entries")->callback([this]() { doList(); });

    std::string titleArg;
    auto* subGet = app.add_subcommand("get", "Show an entry's secret");
    subGet->add_option("title", titleArg, "Entry title")->required();
    subGet->callback([&]() { doGet(titleArg); });

    std::optional<std::string> categoryArg;
    bool generateFlag{ false };
    lockwarden::security::PasswordOptions passwordOptions{};
    bool noLower{ false };
    bool noUpper{ false };
    bool noDigits{ false };
    bool noSymbols{ false };
    const auto applyClassFlags = [&]()
    {
        passwordOptions.lower = !noLower;
        passwordOptions.upper = !noUpper;
        passwordOptions.digits = !noDigits;
        passwordOptions.symbols = !noSymbols;
    };

    auto* subPut = app.add_subcommand("put", "Store an entry (prompts for the secret)");
    subPut->add_option("title", titleArg, "Entry title")->required();
    subPut->add_option("--category,-c", categoryArg, "Entry category");
    subPut->add_flag("--generate,-g", generateFlag, "Store a generated password instead of prompting");
    subPut->add_option("--length,-l", passwordOptions.length, "Generated password length");
    subPut->callback(
        [&]()
        {
            doPut(titleArg, categoryArg,
                  generateFlag ? std::optional<lockwarden::security::PasswordOptions>{ passwordOptions }
                               : std::nullopt);
        });

    auto* subGenerate = app.add_subcommand("generate", "Print a random password");
    subGenerate->add_option("--length,-l", passwordOptions.length, "Password length");
    subGenerate->add_flag("--no-lower", noLower, "Leave out lowercase letters");
    subGenerate->add_flag("--no-upper", noUpper, "Leave out uppercase letters");
    subGenerate->add_flag("--no-digits", noDigits, "Leave out digits");
    subGenerate->add_flag("--no-symbols", noSymbols, "Leave out symbols");
    subGenerate->callback(
        [&]()
        {
            applyClassFlags();
            doGenerate(passwordOptions);
        });

    auto* subRm = app.add_subcommand("rm", "Delete an entry");
    subRm->add_option("title", titleArg, "Entry title")->required();
    subRm->callback([&]() { doRm(titleArg); });

    app.add_subcommand("mfa-enable", "Start second-factor enrollment")->callback([this]() { doMfaEnable(); });
    auto* subMfaConfirm = app.add_subcommand("mfa-confirm", "Confirm enrollment with a current code");
    subMfaConfirm->add_option("code", codeArg, "Code from the authenticator")->required();
    subMfaConfirm->callback([&]() { doMfaConfirm(codeArg); });
    app.add_subcommand("mfa-disable", "Turn the second factor off")->callback([this]() { doMfaDisable(); });

    app.add_subcommand("history", "Show recent security events")->callback([this]() { doHistory(); });
    app.add_subcommand("status", "Show the session state")->callback([this]() { doStatus(); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }

    lockwarden::security::secureWipe(codeArg);
}

void InteractiveShell::report(const core::AuthOutcome& outcome)
{
    if (std::holds_alternative<std::monostate>(outcome))
    {
        m_out << "Vault unlocked.\n";
        return;
    }
    m_out << describeOutcome(outcome) << "\n";
}

// --- Handlers ---

void InteractiveShell::doRegister(const std::string& username)
{
    auto p1 = m_secretReader("New Password: ");
    auto p2 = m_secretReader("Confirm Password: ");

    if (lockwarden::security::asStringView(p1) != lockwarden::security::asStringView(p2))
    {
        m_out << "Error: Passwords do not match.\n";
        return;
    }
    if (p1.empty())
    {
        m_out << "Error: Password must not be empty.\n";
        return;
    }

    const auto result = m_protocol.registerAccount(username, p1);
    if (std::holds_alternative<std::monostate>(result))
    {
        m_out << "Account created. Use 'login " << username << "'.\n";
        return;
    }
    m_out << describeOutcome(result) << "\n";
}

void InteractiveShell::doLogin(const std::string& username)
{
    if (m_controller.state() != core::LockState::SignedOut)
    {
        m_out << "Error: Already signed in. Use 'logout' first.\n";
        return;
    }

    auto pass = m_secretReader("Password: ");
    report(m_controller.signInAsync(username, std::move(pass)).get());
}

void InteractiveShell::doCode(const std::string& code)
{
    report(m_controller.submitSecondFactorAsync(code).get());
}

void InteractiveShell::doCancel()
{
    if (m_controller.state() != core::LockState::AwaitingSecondFactor)
    {
        m_out << "Error: No second-factor step pending.\n";
        return;
    }
    m_controller.cancelSecondFactor();
    m_out << "Second factor cancelled (" << core::toString(m_controller.state()) << ").\n";
}

void InteractiveShell::doUnlock()
{
    if (m_controller.state() != core::LockState::Locked)
    {
        m_out << "Error: Session is not locked.\n";
        return;
    }

    auto pass = m_secretReader("Password: ");
    report(m_controller.unlockAsync(std::move(pass)).get());
}

void InteractiveShell::doLock()
{
    if (m_controller.state() != core::LockState::Unlocked)
    {
        m_out << "Error: Vault is locked.\n";
        return;
    }
    m_controller.lock();
    m_out << "Session locked.\n";
}

void InteractiveShell::doLogout()
{
    m_controller.logout();
    m_out << "Signed out.\n";
}

void InteractiveShell::doList()
{
    const bool unlocked = m_controller.readCollection(
        [this](const core::CredentialCollection& collection)
        {
            if (collection.empty())
            {
                m_out << "(empty)\n";
                return;
            }
            for (const auto& [title, record] : collection.entries())
            {
                m_out << " - " << title;
                if (record.category.has_value())
                {
                    m_out << " [" << *record.category << "]";
                }
                m_out << " (updated " << record.updatedAt << ")\n";
            }
        });

    if (!unlocked)
    {
        m_out << "Error: Vault is locked.\n";
    }
}

void InteractiveShell::doGet(const std::string& title)
{
    bool found = false;
    const bool unlocked = m_controller.readCollection(
        [&](const core::CredentialCollection& collection)
        {
            if (const auto* record = collection.find(title))
            {
                found = true;
                m_out << lockwarden::security::asStringView(record->secret) << "\n";
            }
        });

    if (!unlocked)
    {
        m_out << "Error: Vault is locked.\n";
    }
    else if (!found)
    {
        m_out << "Error: No entry named '" << title << "'.\n";
    }
}

void InteractiveShell::doPut(const std::string& title, const std::optional<std::string>& category,
                             const std::optional<lockwarden::security::PasswordOptions>& generate)
{
    if (m_controller.state() != core::LockState::Unlocked)
    {
        m_out << "Error: Vault is locked.\n";
        return;
    }

    lockwarden::security::SecureString value;
    if (generate.has_value())
    {
        auto generated = lockwarden::security::generatePassword(*generate);
        if (!generated.has_value())
        {
            m_out << "Error: Random source unavailable.\n";
            return;
        }
        value = std::move(*generated);
    }
    else
    {
        value = m_secretReader("Secret Value: ");
    }

    const auto result = m_controller.modifyCollection(
        [&](core::CredentialCollection& collection)
        {
            core::CredentialRecord record{};
            if (const auto* existing = collection.find(title))
            {
                record.category = existing->category;
                record.extra = existing->extra;
            }
            record.secret = value;
            record.updatedAt = core::currentTimestamp();
            if (category.has_value())
            {
                record.category = category;
            }
            collection.put(title, std::move(record));
        });

    if (std::holds_alternative<std::monostate>(result))
    {
        m_out << "Entry saved.\n";
        return;
    }
    m_out << describeOutcome(result) << "\n";
}

void InteractiveShell::doGenerate(const lockwarden::security::PasswordOptions& options)
{
    const auto password = lockwarden::security::generatePassword(options);
    if (!password.has_value())
    {
        m_out << "Error: Random source unavailable.\n";
        return;
    }
    if (password->empty())
    {
        m_out << "Error: Enable at least one character class.\n";
        return;
    }
    m_out << lockwarden::security::asStringView(*password) << "\n";
}

void InteractiveShell::doRm(const std::string& title)
{
    bool existed = false;
    const auto result = m_controller.modifyCollection([&](core::CredentialCollection& collection)
                                                      { existed = collection.erase(title); });

    if (!std::holds_alternative<std::monostate>(result))
    {
        if (std::holds_alternative<core::NotPermitted>(result))
        {
            m_out << "Error: Vault is locked.\n";
            return;
        }
        m_out << describeOutcome(result) << "\n";
        return;
    }
    if (!existed)
    {
        m_out << "Error: No entry named '" << title << "'.\n";
        return;
    }
    m_out << "Entry deleted.\n";
}

void InteractiveShell::doMfaEnable()
{
    auto result = m_controller.enrollSecondFactor();
    auto* enrollment = std::get_if<core::SecondFactorEnrollment>(&result);
    if (enrollment == nullptr)
    {
        std::visit(
            [this](const auto& alternative)
            {
                using Alternative = std::decay_t<decltype(alternative)>;
                if constexpr (!std::is_same_v<Alternative, core::SecondFactorEnrollment>)
                {
                    m_out << describe(alternative) << "\n";
                }
            },
            result);
        return;
    }

    m_out << "Shared secret: " << lockwarden::security::asStringView(enrollment->sharedSecret) << "\n";
    m_out << "Provisioning URI: " << enrollment->provisioningUri << "\n";
    m_out << "Recovery codes:\n";
    for (const auto& code : enrollment->recoveryCodes)
    {
        m_out << "  " << lockwarden::security::asStringView(code) << "\n";
    }
    m_out << "Confirm with 'mfa-confirm <code>'.\n";
}

void InteractiveShell::doMfaConfirm(const std::string& code)
{
    const auto result = m_controller.confirmSecondFactor(code);
    if (const auto* accepted = std::get_if<bool>(&result))
    {
        m_out << (*accepted ? "Second factor enabled.\n" : "Error: Code rejected.\n");
        return;
    }
    std::visit(
        [this](const auto& alternative)
        {
            using Alternative = std::decay_t<decltype(alternative)>;
            if constexpr (!std::is_same_v<Alternative, bool>)
            {
                m_out << describe(alternative) << "\n";
            }
        },
        result);
}

void InteractiveShell::doMfaDisable()
{
    const auto result = m_controller.disableSecondFactor();
    if (const auto* done = std::get_if<bool>(&result))
    {
        m_out << (*done ? "Second factor disabled.\n" : "Error: Could not disable the second factor.\n");
        return;
    }
    std::visit(
        [this](const auto& alternative)
        {
            using Alternative = std::decay_t<decltype(alternative)>;
            if constexpr (!std::is_same_v<Alternative, bool>)
            {
                m_out << describe(alternative) << "\n";
            }
        },
        result);
}

void InteractiveShell::doHistory()
{
    const auto user = m_controller.username();
    if (user.empty())
    {
        m_out << "Error: Not signed in.\n";
        return;
    }

    std::vector<core::AuditEntry> entries;
    try
    {
        entries = m_audit.recent(user);
    }
    catch (const std::runtime_error& e)
    {
        lockwarden::log::error("history: ", e.what());
        m_out << "Error: Could not read the activity log.\n";
        return;
    }

    if (entries.empty())
    {
        m_out << "(no entries)\n";
        return;
    }
    for (const auto& entry : entries)
    {
        m_out << entry.timestamp << "  " << entry.action << "\n";
    }
}

void InteractiveShell::doStatus()
{
    const auto user = m_controller.username();
    m_out << "State: " << core::toString(m_controller.state());
    if (!user.empty())
    {
        m_out << " (" << user << ")";
    }
    m_out << "\n";
}

} // namespace lockwarden::ui::cli
