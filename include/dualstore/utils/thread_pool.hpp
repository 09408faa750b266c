#pragma once

#include "dualstore/errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace dualstore {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    // Disable copy
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit a task and get a future for the result
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
        using return_type = decltype(f(args...));

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return result;
    }

    // Submit a task without waiting for result
    void enqueue(std::function<void()> task);

    // Get number of threads
    size_t size() const { return workers_.size(); }

    // Get number of pending tasks
    size_t pending() const;

    // Shutdown the pool; queued tasks still run before the workers exit
    void shutdown();

    // Check if pool is running
    bool running() const { return !stop_; }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

// Runs fn on the pool and waits at most `timeout` for it. Throws TimeoutError
// when the deadline passes first; the task itself is not cancelled and keeps
// running on its worker. Exceptions thrown by fn are rethrown here.
template<class F>
auto run_with_timeout(ThreadPool& pool, F&& fn, std::chrono::milliseconds timeout,
                      const std::string& what = "operation") -> decltype(fn()) {
    auto future = pool.submit(std::forward<F>(fn));
    if (future.wait_for(timeout) != std::future_status::ready) {
        throw TimeoutError(what + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    return future.get();
}

} // namespace dualstore
