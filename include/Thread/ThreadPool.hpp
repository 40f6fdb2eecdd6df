#pragma once
#include "core/Common.hpp"

#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>

// Fixed set of workers draining a FIFO of jobs. Used to run independent
// solvers over the same read-only maze.
class ThreadPool final {
public:
    // 0 picks hardware_concurrency (falls back to one worker per solver)
    explicit ThreadPool(size_t threadCount = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const noexcept;

    // Finishes the jobs already queued, then joins the workers.
    void shutdown();

    template <class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using R = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stop_) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

private:
    void workerLoop();

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_{false};

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
};
