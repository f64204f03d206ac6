#include "bulkcp/metrics.hpp"
#include "bulkcp/progress.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace bulkcp {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& transfers_family = prometheus::BuildCounter()
        .Name("bulkcp_transfers_total")
        .Help("Transfers settled")
        .Labels(labels)
        .Register(*registry_);
    transfers_success_ = &transfers_family.Add({{"result", "success"}});
    transfers_failure_ = &transfers_family.Add({{"result", "failure"}});

    auto& tasks_family = prometheus::BuildCounter()
        .Name("bulkcp_tasks_total")
        .Help("Copy tasks settled")
        .Labels(labels)
        .Register(*registry_);
    for (TaskKind kind : {TaskKind::Whole, TaskKind::Part, TaskKind::Finalize}) {
        auto k = static_cast<size_t>(kind);
        tasks_[k][0] = &tasks_family.Add({{"kind", task_kind_name(kind)}, {"result", "failure"}});
        tasks_[k][1] = &tasks_family.Add({{"kind", task_kind_name(kind)}, {"result", "success"}});
    }

    bytes_total_ = &prometheus::BuildCounter()
        .Name("bulkcp_bytes_total")
        .Help("Total bytes copied")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    files_total_ = &prometheus::BuildCounter()
        .Name("bulkcp_files_total")
        .Help("Total files copied")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    active_tasks_ = &gauge_reg("bulkcp_active_tasks", "Tasks currently moving bytes");
    files_discovered_ = &gauge_reg("bulkcp_files_discovered", "Files found by planning");
    bytes_discovered_ = &gauge_reg("bulkcp_bytes_discovered", "Bytes found by planning");

    // --- Histograms ---

    task_duration_ = &prometheus::BuildHistogram()
        .Name("bulkcp_task_duration_seconds")
        .Help("Copy task duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

prometheus::Counter& MetricsExporter::tasks(TaskKind kind, bool success) {
    return *tasks_[static_cast<size_t>(kind)][success ? 1 : 0];
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    if (progress_) {
        auto snap = progress_->snapshot();
        files_discovered_->Set(static_cast<double>(snap.files_discovered));
        bytes_discovered_->Set(static_cast<double>(snap.bytes_discovered));
    }
}

void MetricsExporter::write_file() {
    std::lock_guard lock(write_mutex_);

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace bulkcp
