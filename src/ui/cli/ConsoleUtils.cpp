#include "ConsoleUtils.hpp"
#include "lockwarden/log/Log.hpp"
#include "lockwarden/security/ScopeWipe.hpp"

#include <iostream>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace lockwarden::ui::cli
{

namespace
{

// Disables echo for its lifetime; restores the saved terminal mode even when reading throws.
class EchoOff final
{
public:
    EchoOff()
    {
        if (isatty(STDIN_FILENO) == 0 || tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        struct termios quiet = m_saved;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
    }

    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;
    EchoOff(EchoOff&&) = delete;
    EchoOff& operator=(EchoOff&&) = delete;

    ~EchoOff()
    {
        if (m_active)
        {
            (void)tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
        }
    }

    [[nodiscard]] bool active() const noexcept
    {
        return m_active;
    }

private:
    struct termios m_saved
    {
    };
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
    if (mlockall(MCL_CURRENT | MCL_FUTURE) != 0)
    {
        lockwarden::log::warning("mlockall failed; secrets may reach swap");
    }
    struct rlimit lim
    {
        0, 0
    };
    if (setrlimit(RLIMIT_CORE, &lim) != 0)
    {
        lockwarden::log::warning("could not disable core dumps");
    }
}

lockwarden::security::SecureString readSecret(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    {
        const EchoOff echoOff{};
        std::getline(std::cin, line);
        if (echoOff.active())
        {
            std::cout << "\n";
        }
    }
    auto wipeLine{ lockwarden::security::scopeWipe(line) };

    return lockwarden::security::secureStringFrom(line);
}

} // namespace lockwarden::ui::cli
