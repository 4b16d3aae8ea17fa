#include "lockwarden/core/BackgroundExecutor.hpp"

namespace lockwarden::core
{

BackgroundExecutor::BackgroundExecutor(std::size_t workers)
{
    const std::size_t count{ (workers == 0U) ? 1U : workers };
    m_workers.reserve(count);
    for (std::size_t i{}; i < count; ++i)
    {
        m_workers.emplace_back([this]() { run(); });
    }
}

BackgroundExecutor::~BackgroundExecutor()
{
    {
        const std::lock_guard<std::mutex> guard{ m_mutex };
        m_stopping = true;
    }
    m_wake.notify_all();
    for (auto& worker : m_workers)
    {
        worker.join();
    }
}

void BackgroundExecutor::run()
{
    for (;;)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock{ m_mutex };
            m_wake.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty())
            {
                return;
            }
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }
        task();
    }
}

} // namespace lockwarden::core
