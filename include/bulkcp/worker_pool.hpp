#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace bulkcp {

/// Fixed-size pool of threads pulling jobs from an unbounded queue.
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a job. Jobs must not throw; an escaping exception is logged.
    void execute(std::function<void()> job);

    /// Block until the queue is empty and no job is running.
    void wait_idle();

    /// Like wait_idle() but gives up after `timeout`; true if idle.
    bool wait_idle_for(std::chrono::milliseconds timeout);

    /// Stop the workers. With `drain`, queued jobs run first; otherwise
    /// they are dropped.
    void shutdown(bool drain);

    size_t pending() const;
    size_t size() const { return threads_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    bool stopping_ = false;
};

/// Global cancellation flag with an optional deadline.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    /// True after cancel() or once the deadline has passed.
    bool cancelled() const noexcept;

    void set_deadline(std::chrono::steady_clock::time_point deadline) noexcept;

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int64_t> deadline_ns_{0};  // steady_clock ticks; 0 = none
};

/// Counting permit pool bounding how many tasks move bytes at once.
class CountingSemaphore {
public:
    explicit CountingSemaphore(size_t limit);

    /// Wait for a permit; false if the token was cancelled first.
    bool acquire(const CancellationToken& token);
    void release();

    size_t available() const;
    size_t limit() const { return limit_; }

private:
    const size_t limit_;
    size_t available_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

/// Holds one permit for the lifetime of the guard.
class SemaphoreGuard {
public:
    explicit SemaphoreGuard(CountingSemaphore& sem) : sem_(&sem) {}
    ~SemaphoreGuard() {
        if (sem_) sem_->release();
    }

    SemaphoreGuard(const SemaphoreGuard&) = delete;
    SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

private:
    CountingSemaphore* sem_;
};

} // namespace bulkcp
