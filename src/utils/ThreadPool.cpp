#include "mm/utils/ThreadPool.hpp"

#include <algorithm>

namespace mm::utils {

namespace {

constexpr std::size_t kMaxThreads = 64;

} // namespace

std::size_t ThreadPool::ResolveThreadCount(std::size_t requested) {
    if (requested == 0) {
        requested = std::thread::hardware_concurrency();
    }
    return std::clamp<std::size_t>(requested, 1, kMaxThreads);
}

ThreadPool::ThreadPool(std::size_t threadCount) {
    threadCount = ResolveThreadCount(threadCount);
    m_workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        m_workers.emplace_back([this]() { WorkerLoop(); });
    }
}

std::size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_condition.notify_all();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this]() { return m_stopping || !m_tasks.empty(); });
            if (m_stopping && m_tasks.empty()) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }
        task();
    }
}

} // namespace mm::utils
