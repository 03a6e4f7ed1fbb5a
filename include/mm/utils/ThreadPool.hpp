#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace mm::utils {

/**
 * @brief Fixed set of workers draining a FIFO task queue.
 *
 * Exceptions thrown by a task are captured in its future. Destruction finishes
 * the queued tasks before joining.
 */
class ThreadPool {
public:
    // 0 selects the hardware concurrency.
    explicit ThreadPool(std::size_t threadCount = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t ThreadCount() const { return m_workers.size(); }
    std::size_t PendingTasks() const;

    template <typename Func, typename... Args>
    auto Submit(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>> {
        using ResultType = std::invoke_result_t<Func, Args...>;

        auto task = std::make_shared<std::packaged_task<ResultType()>>(
            std::bind(std::forward<Func>(func), std::forward<Args>(args)...));

        std::future<ResultType> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                throw std::runtime_error("ThreadPool::Submit on stopped pool");
            }
            m_tasks.emplace([task]() { (*task)(); });
        }
        m_condition.notify_one();
        return future;
    }

    /**
     * Submits `func(item)` for every element and returns the futures in
     * element order. Elements are passed by reference and must outlive the
     * futures.
     */
    template <typename Container, typename Func>
    auto SubmitEach(const Container& items, Func func)
        -> std::vector<std::future<std::invoke_result_t<Func&, const typename Container::value_type&>>> {
        std::vector<std::future<std::invoke_result_t<Func&, const typename Container::value_type&>>> futures;
        futures.reserve(items.size());
        for (const auto& item : items) {
            futures.push_back(Submit([func, &item]() mutable { return func(item); }));
        }
        return futures;
    }

    // Blocks until every future is ready without consuming results or exceptions.
    template <typename T>
    static void WaitAll(std::vector<std::future<T>>& futures) {
        for (auto& future : futures) {
            future.wait();
        }
    }

    // Worker count for a configured value: 0 selects the hardware concurrency.
    static std::size_t ResolveThreadCount(std::size_t requested);

private:
    void WorkerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_stopping = false;
};

} // namespace mm::utils
