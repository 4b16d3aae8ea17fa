#ifndef INCLUDE_LOCKWARDEN_CORE_IDLETIMER_HPP
#define INCLUDE_LOCKWARDEN_CORE_IDLETIMER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace lockwarden::core
{

// One-shot countdown on a dedicated thread. Every arm() or cancel() starts a new generation, so a
// countdown that was replaced can never fire. The callback runs on the timer thread and receives the
// generation it was armed with.
class IdleTimer final
{
public:
    using Clock = std::chrono::steady_clock;
    using Generation = std::uint64_t;
    using Callback = std::function<void(Generation)>;

    explicit IdleTimer(Callback onExpired);

    IdleTimer(const IdleTimer&) = delete;
    IdleTimer& operator=(const IdleTimer&) = delete;
    IdleTimer(IdleTimer&&) = delete;
    IdleTimer& operator=(IdleTimer&&) = delete;
    ~IdleTimer();

    // Replaces any pending countdown.
    Generation arm(std::chrono::milliseconds timeout);
    void cancel();

    [[nodiscard]] bool armed() const;

private:
    Callback m_onExpired;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::optional<Clock::time_point> m_deadline;
    Generation m_generation{ 0 };
    bool m_stopping{ false };
    std::thread m_worker;

    void run();
};

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_IDLETIMER_HPP
