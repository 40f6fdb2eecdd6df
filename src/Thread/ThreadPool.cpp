#include "core/Common.hpp"
#include "Thread/ThreadPool.hpp"

ThreadPool::ThreadPool(size_t threadCount)
{
    if (threadCount == 0) {
        threadCount = std::thread::hardware_concurrency();
        if (threadCount == 0) threadCount = 3;
    }

    workers_.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

size_t ThreadPool::size() const noexcept
{
    std::lock_guard<std::mutex> lock(mtx_);
    return workers_.size();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stop_) return;
        stop_ = true;
    }
    cv_.notify_all();

    // workers drain the queue before leaving, so every future gets a value
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }

    std::lock_guard<std::mutex> lock(mtx_);
    workers_.clear();
}

void ThreadPool::workerLoop()
{
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&] { return stop_ || !tasks_.empty(); });

            if (tasks_.empty()) return;

            job = std::move(tasks_.front());
            tasks_.pop();
        }
        job();
    }
}
