#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "lockwarden/core/IdleTimer.hpp"

using namespace std::chrono_literals;
using lockwarden::core::IdleTimer;

namespace
{

// Collects fired generations and lets the test wait for them.
class FiredLog
{
public:
    void add(IdleTimer::Generation generation)
    {
        {
            const std::lock_guard<std::mutex> guard{ m_mutex };
            m_fired.push_back(generation);
        }
        m_changed.notify_all();
    }

    [[nodiscard]] bool waitForCount(std::size_t count, std::chrono::milliseconds limit)
    {
        std::unique_lock<std::mutex> lock{ m_mutex };
        return m_changed.wait_for(lock, limit, [&]() { return m_fired.size() >= count; });
    }

    [[nodiscard]] std::vector<IdleTimer::Generation> fired() const
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        return m_fired;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_changed;
    std::vector<IdleTimer::Generation> m_fired;
};

} // namespace

TEST(IdleTimer, FiresOnceWithItsGeneration)
{
    FiredLog log;
    IdleTimer timer{ [&](IdleTimer::Generation g) { log.add(g); } };

    const auto start{ IdleTimer::Clock::now() };
    const auto generation{ timer.arm(50ms) };
    EXPECT_TRUE(timer.armed());

    ASSERT_TRUE(log.waitForCount(1U, 2s));
    EXPECT_GE(IdleTimer::Clock::now() - start, 50ms);
    EXPECT_FALSE(timer.armed());

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(log.fired(), std::vector<IdleTimer::Generation>{ generation });
}

TEST(IdleTimer, RearmReplacesThePendingCountdown)
{
    FiredLog log;
    IdleTimer timer{ [&](IdleTimer::Generation g) { log.add(g); } };

    const auto first{ timer.arm(60ms) };
    std::this_thread::sleep_for(30ms);
    const auto start{ IdleTimer::Clock::now() };
    const auto second{ timer.arm(60ms) };
    EXPECT_NE(first, second);

    ASSERT_TRUE(log.waitForCount(1U, 2s));
    EXPECT_GE(IdleTimer::Clock::now() - start, 60ms);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(log.fired(), std::vector<IdleTimer::Generation>{ second });
}

TEST(IdleTimer, CancelPreventsFiring)
{
    std::atomic<int> fired{ 0 };
    IdleTimer timer{ [&](IdleTimer::Generation) { ++fired; } };

    (void)timer.arm(30ms);
    timer.cancel();
    EXPECT_FALSE(timer.armed());

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(fired.load(), 0);
}

TEST(IdleTimer, CallbackMayRearm)
{
    FiredLog log;
    IdleTimer* self{ nullptr };
    IdleTimer timer{ [&](IdleTimer::Generation g)
                     {
                         log.add(g);
                         if (log.fired().size() == 1U)
                         {
                             (void)self->arm(10ms);
                         }
                     } };
    self = &timer;

    (void)timer.arm(10ms);
    EXPECT_TRUE(log.waitForCount(2U, 2s));
}

TEST(IdleTimer, DestroyingWhileArmedDoesNotFire)
{
    std::atomic<int> fired{ 0 };
    {
        IdleTimer timer{ [&](IdleTimer::Generation) { ++fired; } };
        (void)timer.arm(10s);
    }
    EXPECT_EQ(fired.load(), 0);
}
