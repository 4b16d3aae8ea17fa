#ifndef LOCKWARDEN_UI_CLI_CONSOLEUTILS_HPP
#define LOCKWARDEN_UI_CLI_CONSOLEUTILS_HPP

#include "lockwarden/security/SecureString.hpp"
#include <string>

namespace lockwarden::ui::cli
{

// Keeps secrets out of swap and core dumps. Failures are logged, not fatal.
void lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo disabled when stdin is a terminal.
[[nodiscard]] lockwarden::security::SecureString readSecret(const std::string& prompt);

} // namespace lockwarden::ui::cli

#endif // LOCKWARDEN_UI_CLI_CONSOLEUTILS_HPP
