#include "bulkcp/worker_pool.hpp"
#include "bulkcp/core/log.hpp"

#include <exception>

namespace bulkcp {

// ============================================================================
// WorkerPool
// ============================================================================

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;
    threads_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown(true);
}

void WorkerPool::execute(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            log_warn("worker pool is shutting down; job dropped");
            return;
        }
        queue_.push_back(std::move(job));
    }
    work_cv_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

bool WorkerPool::wait_idle_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::shutdown(bool drain) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
        if (!drain) queue_.clear();
    }
    work_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    idle_cv_.notify_all();
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            log_error("worker job failed: %s", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (queue_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

// ============================================================================
// CancellationToken
// ============================================================================

bool CancellationToken::cancelled() const noexcept {
    if (cancelled_.load(std::memory_order_acquire)) return true;
    auto deadline = deadline_ns_.load(std::memory_order_relaxed);
    if (deadline == 0) return false;
    return std::chrono::steady_clock::now().time_since_epoch().count() >= deadline;
}

void CancellationToken::set_deadline(std::chrono::steady_clock::time_point deadline) noexcept {
    deadline_ns_.store(deadline.time_since_epoch().count(), std::memory_order_relaxed);
}

// ============================================================================
// CountingSemaphore
// ============================================================================

CountingSemaphore::CountingSemaphore(size_t limit)
    : limit_(limit == 0 ? 1 : limit)
    , available_(limit_) {}

bool CountingSemaphore::acquire(const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (available_ == 0) {
        if (token.cancelled()) return false;
        // Periodic wakeup so cancellation and deadlines are noticed
        cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (token.cancelled()) return false;
    --available_;
    return true;
}

void CountingSemaphore::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ < limit_) ++available_;
    }
    cv_.notify_one();
}

size_t CountingSemaphore::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

} // namespace bulkcp
