#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/// Named set of worker threads fed from one FIFO queue.
///
/// Blocks of one request and requests themselves run on separate pools:
/// a request worker waits on its block fetches, so sharing a pool could
/// starve the fetches it waits for. Workers label their log lines
/// "<name>-<n>".
class ThreadPool {
public:
    /// @throws std::invalid_argument when num_threads is 0.
    explicit ThreadPool(size_t num_threads, std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a callable; its result or exception arrives through the future.
    /// @throws std::runtime_error once shutdown() has begun.
    template<typename F>
    auto submit(F&& func) -> std::future<decltype(func())>;

    /// Refuse new work, run everything already queued, join the workers.
    /// Idempotent.
    void shutdown();

    size_t size() const { return workers_.size(); }

    /// Tasks queued but not yet picked up.
    size_t pending() const;

    /// Tasks currently executing.
    size_t busy() const { return busy_.load(std::memory_order_relaxed); }

    const std::string& name() const { return name_; }

private:
    void enqueue(std::function<void()> job);
    void workerLoop(size_t index);

    std::string name_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable work_ready_;
    std::deque<std::function<void()>> queue_;   // guarded by mutex_
    bool stopping_ = false;                     // guarded by mutex_
    std::atomic<size_t> busy_{0};
};

template<typename F>
auto ThreadPool::submit(F&& func) -> std::future<decltype(func())> {
    using Result = decltype(func());

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(func));
    std::future<Result> result = task->get_future();
    enqueue([task] { (*task)(); });
    return result;
}
