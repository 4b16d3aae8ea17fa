#ifndef INCLUDE_LOCKWARDEN_LOG_LOG_HPP
#define INCLUDE_LOCKWARDEN_LOG_LOG_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

// Leveled diagnostics for the whole library.
//
//   lockwarden::log::setLevel(lockwarden::log::Level::Debug);
//   lockwarden::log::info("session locked for ", username);
//
// Output line: [YYYY-MM-DD HH:MM:SS.mmm] LEVEL: message
// Never pass secrets, keys, tokens or second-factor codes.
namespace lockwarden::log
{

enum class Level : std::uint8_t
{
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

void setLevel(Level level) noexcept;
[[nodiscard]] Level level() noexcept;

// nullptr restores std::cerr. The stream must outlive all logging.
void setSink(std::ostream* sink) noexcept;

// Accepts "debug", "info", "warning"/"warn", "error", "off".
[[nodiscard]] std::optional<Level> parseLevel(std::string_view text) noexcept;

namespace detail
{

void write(Level level, std::string_view message);

template <class... Args> [[nodiscard]] std::string concat(Args&&... args)
{
    std::ostringstream out;
    (out << ... << std::forward<Args>(args));
    return out.str();
}

template <class... Args> void emit(Level lvl, Args&&... args)
{
    if (lvl < level())
    {
        return;
    }
    write(lvl, concat(std::forward<Args>(args)...));
}

} // namespace detail

template <class... Args> void debug(Args&&... args)
{
    detail::emit(Level::Debug, std::forward<Args>(args)...);
}

template <class... Args> void info(Args&&... args)
{
    detail::emit(Level::Info, std::forward<Args>(args)...);
}

template <class... Args> void warning(Args&&... args)
{
    detail::emit(Level::Warning, std::forward<Args>(args)...);
}

template <class... Args> void error(Args&&... args)
{
    detail::emit(Level::Error, std::forward<Args>(args)...);
}

} // namespace lockwarden::log

#endif // INCLUDE_LOCKWARDEN_LOG_LOG_HPP
