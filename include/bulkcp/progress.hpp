#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace bulkcp {

// Increment reported by an in-flight task. Never negative.
struct ProgressDelta {
    uint64_t files = 0;
    uint64_t bytes = 0;
};

struct ProgressSnapshot {
    uint64_t files_completed = 0;
    uint64_t bytes_transferred = 0;
    uint64_t files_discovered = 0;
    uint64_t bytes_discovered = 0;
};

/// Thread-safe running totals fed by copy tasks. Never blocks the caller.
class ProgressSink {
public:
    void on_progress(const ProgressDelta& delta) noexcept {
        files_completed_.fetch_add(delta.files, std::memory_order_relaxed);
        bytes_transferred_.fetch_add(delta.bytes, std::memory_order_relaxed);
    }

    /// Planned work, reported as transfers are expanded.
    void on_discovered(const ProgressDelta& delta) noexcept {
        files_discovered_.fetch_add(delta.files, std::memory_order_relaxed);
        bytes_discovered_.fetch_add(delta.bytes, std::memory_order_relaxed);
    }

    ProgressSnapshot snapshot() const noexcept;

private:
    std::atomic<uint64_t> files_completed_{0};
    std::atomic<uint64_t> bytes_transferred_{0};
    std::atomic<uint64_t> files_discovered_{0};
    std::atomic<uint64_t> bytes_discovered_{0};
};

/// "1.5 MiB" style rendering
std::string format_bytes(uint64_t bytes);

/// Periodically renders a ProgressSink to a stream from a background thread.
class ProgressReporter {
public:
    ProgressReporter(const ProgressSink& sink, std::ostream& out,
                     std::chrono::milliseconds interval);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void start();

    /// Stop the render thread and print one final line.
    void stop();

    /// "files: 3/10, bytes: 1.0 MiB/4.0 MiB"
    static std::string format_snapshot(const ProgressSnapshot& snapshot);

private:
    void render_loop();
    void render();

    const ProgressSink& sink_;
    std::ostream& out_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

} // namespace bulkcp
