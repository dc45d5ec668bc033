#include "thread_pool.h"
#include "logger.h"

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name))
{
    if (num_threads == 0) {
        throw std::invalid_argument("ThreadPool " + name_ + " needs at least one thread");
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this, i);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("ThreadPool " + name_ + " is shut down");
        }
        queue_.push_back(std::move(job));
    }
    work_ready_.notify_one();
}

void ThreadPool::workerLoop(size_t index) {
    setThreadLogLabel(name_ + "-" + std::to_string(index));

    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_ready_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;   // stopping and drained
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            busy_.fetch_add(1, std::memory_order_relaxed);
        }
        // Jobs are packaged_tasks; exceptions land in their futures.
        job();
        busy_.fetch_sub(1, std::memory_order_relaxed);
    }
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_ready_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
