#pragma once

#include "bulkcp/transfer.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace bulkcp {

class ProgressSink;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports copy metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Progress totals sampled into the discovered gauges (not owned).
    void set_progress(const ProgressSink* progress) { progress_ = progress; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    // --- Counter accessors ---
    prometheus::Counter& transfers_success() { return *transfers_success_; }
    prometheus::Counter& transfers_failure() { return *transfers_failure_; }
    prometheus::Counter& tasks(TaskKind kind, bool success);
    prometheus::Counter& bytes_total() { return *bytes_total_; }
    prometheus::Counter& files_total() { return *files_total_; }

    // --- Gauge accessors ---
    prometheus::Gauge& active_tasks() { return *active_tasks_; }

    // --- Histogram accessors ---
    prometheus::Histogram& task_duration() { return *task_duration_; }

    /// Serialize the registry to the .prom file now.
    void write_file();

private:
    void writer_loop();
    void update_gauges();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    const ProgressSink* progress_ = nullptr;

    // --- Counters ---
    prometheus::Counter* transfers_success_;
    prometheus::Counter* transfers_failure_;
    // [kind][0 = failure, 1 = success]
    std::array<std::array<prometheus::Counter*, 2>, 3> tasks_{};
    prometheus::Counter* bytes_total_;
    prometheus::Counter* files_total_;

    // --- Gauges ---
    prometheus::Gauge* active_tasks_;
    prometheus::Gauge* files_discovered_;
    prometheus::Gauge* bytes_discovered_;

    // --- Histograms ---
    prometheus::Histogram* task_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;

    std::mutex write_mutex_;
};

}  // namespace bulkcp
