#include "lockwarden/log/Log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace lockwarden::log
{
namespace
{

std::atomic<Level> g_level{ Level::Info };
std::atomic<std::ostream*> g_sink{ nullptr };
std::mutex g_writeMutex;

[[nodiscard]] std::string_view levelName(Level level) noexcept
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO ";
    case Level::Warning:
        return "WARN ";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        break;
    }
    return "?????";
}

[[nodiscard]] std::string timestamp()
{
    const auto now{ std::chrono::system_clock::now() };
    const auto ms{ std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000 };
    const std::time_t seconds{ std::chrono::system_clock::to_time_t(now) };

    std::tm tm{};
    localtime_r(&seconds, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return out.str();
}

} // namespace

void setLevel(Level level) noexcept
{
    g_level.store(level);
}

Level level() noexcept
{
    return g_level.load();
}

void setSink(std::ostream* sink) noexcept
{
    g_sink.store(sink);
}

std::optional<Level> parseLevel(std::string_view text) noexcept
{
    if (text == "debug")
    {
        return Level::Debug;
    }
    if (text == "info")
    {
        return Level::Info;
    }
    if (text == "warning" || text == "warn")
    {
        return Level::Warning;
    }
    if (text == "error")
    {
        return Level::Error;
    }
    if (text == "off")
    {
        return Level::Off;
    }
    return std::nullopt;
}

namespace detail
{

void write(Level level, std::string_view message)
{
    std::ostream* sink{ g_sink.load() };
    std::ostream& out{ (sink != nullptr) ? *sink : std::cerr };

    const std::string stamp{ timestamp() };
    const std::lock_guard<std::mutex> guard{ g_writeMutex };
    out << '[' << stamp << "] " << levelName(level) << ": " << message << '\n';
}

} // namespace detail

} // namespace lockwarden::log
