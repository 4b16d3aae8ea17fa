#include "lockwarden/core/IdleTimer.hpp"

#include <utility>

namespace lockwarden::core
{

IdleTimer::IdleTimer(Callback onExpired) : m_onExpired(std::move(onExpired))
{
    m_worker = std::thread{ [this]() { run(); } };
}

IdleTimer::~IdleTimer()
{
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        m_stopping = true;
        m_deadline.reset();
    }
    m_wake.notify_all();
    if (m_worker.joinable())
    {
        m_worker.join();
    }
}

IdleTimer::Generation IdleTimer::arm(std::chrono::milliseconds timeout)
{
    Generation armedWith{};
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        ++m_generation;
        m_deadline = Clock::now() + timeout;
        armedWith = m_generation;
    }
    m_wake.notify_all();
    return armedWith;
}

void IdleTimer::cancel()
{
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        ++m_generation;
        m_deadline.reset();
    }
    m_wake.notify_all();
}

bool IdleTimer::armed() const
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    return m_deadline.has_value();
}

void IdleTimer::run()
{
    std::unique_lock<std::mutex> lock{ m_mutex };
    while (!m_stopping)
    {
        if (!m_deadline.has_value())
        {
            m_wake.wait(lock, [this]() { return m_stopping || m_deadline.has_value(); });
            continue;
        }

        const Generation waitingOn{ m_generation };
        const auto deadline{ *m_deadline };
        m_wake.wait_until(lock, deadline, [this, waitingOn]() { return m_stopping || m_generation != waitingOn; });
        if (m_stopping || m_generation != waitingOn || Clock::now() < deadline)
        {
            continue;
        }

        m_deadline.reset();
        lock.unlock();
        m_onExpired(waitingOn);
        lock.lock();
    }
}

} // namespace lockwarden::core
