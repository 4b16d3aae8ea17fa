#ifndef INCLUDE_LOCKWARDEN_CORE_BACKGROUNDEXECUTOR_HPP
#define INCLUDE_LOCKWARDEN_CORE_BACKGROUNDEXECUTOR_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace lockwarden::core
{

// Fixed pool that keeps key derivation and network round trips off the caller's thread.
// Exceptions thrown by a task surface through its future.
class BackgroundExecutor final
{
public:
    explicit BackgroundExecutor(std::size_t workers = 1);

    BackgroundExecutor(const BackgroundExecutor&) = delete;
    BackgroundExecutor& operator=(const BackgroundExecutor&) = delete;
    BackgroundExecutor(BackgroundExecutor&&) = delete;
    BackgroundExecutor& operator=(BackgroundExecutor&&) = delete;

    // Drains queued tasks before joining.
    ~BackgroundExecutor();

    template <class Fn> [[nodiscard]] std::future<std::invoke_result_t<Fn>> submit(Fn fn)
    {
        using Result = std::invoke_result_t<Fn>;
        auto task{ std::make_shared<std::packaged_task<Result()>>(std::move(fn)) };
        auto future{ task->get_future() };
        {
            const std::lock_guard<std::mutex> guard{ m_mutex };
            if (m_stopping)
            {
                throw std::logic_error("BackgroundExecutor: submit after shutdown");
            }
            m_queue.emplace_back([task]() { (*task)(); });
        }
        m_wake.notify_one();
        return future;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_wake;
    std::deque<std::function<void()>> m_queue;
    bool m_stopping{ false };
    std::vector<std::thread> m_workers;

    void run();
};

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_BACKGROUNDEXECUTOR_HPP
