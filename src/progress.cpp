#include "bulkcp/progress.hpp"

#include <cstdio>

namespace bulkcp {

ProgressSnapshot ProgressSink::snapshot() const noexcept {
    ProgressSnapshot s;
    s.files_completed = files_completed_.load(std::memory_order_relaxed);
    s.bytes_transferred = bytes_transferred_.load(std::memory_order_relaxed);
    s.files_discovered = files_discovered_.load(std::memory_order_relaxed);
    s.bytes_discovered = bytes_discovered_.load(std::memory_order_relaxed);
    return s;
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

ProgressReporter::ProgressReporter(const ProgressSink& sink, std::ostream& out,
                                   std::chrono::milliseconds interval)
    : sink_(sink)
    , out_(out)
    , interval_(interval) {}

ProgressReporter::~ProgressReporter() {
    stop();
}

std::string ProgressReporter::format_snapshot(const ProgressSnapshot& s) {
    return "files: " + std::to_string(s.files_completed) + "/" +
           std::to_string(s.files_discovered) + ", bytes: " +
           format_bytes(s.bytes_transferred) + "/" + format_bytes(s.bytes_discovered);
}

void ProgressReporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    thread_ = std::thread(&ProgressReporter::render_loop, this);
}

void ProgressReporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        render();
        out_ << std::endl;
    }
}

void ProgressReporter::render_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, interval_, [this] { return !running_; });
            if (!running_) break;
        }
        render();
    }
}

void ProgressReporter::render() {
    out_ << "\r" << format_snapshot(sink_.snapshot()) << std::flush;
}

} // namespace bulkcp
