#pragma once

#include "bulkcp/copy_report.hpp"
#include "bulkcp/core/constants.hpp"
#include "bulkcp/progress.hpp"
#include "bulkcp/storage/router.hpp"
#include "bulkcp/transfer.hpp"
#include "bulkcp/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace bulkcp {

class MetricsExporter;

struct CopierOptions {
    // Most tasks moving bytes at the same instant
    size_t max_simultaneous_transfers = constants::DEFAULT_MAX_SIMULTANEOUS_TRANSFERS;
    // 0 = one worker per concurrency slot
    size_t worker_threads = 0;
    uint64_t part_size = constants::DEFAULT_PART_SIZE;
    size_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    // How long to wait for in-flight tasks after cancellation before warning
    std::chrono::seconds cancel_grace{constants::DEFAULT_CANCEL_GRACE_SECONDS};
};

/// Runs a batch of transfers on a worker pool. Planning and copying happen
/// as pool jobs; a counting semaphore bounds how many tasks move bytes at
/// once. Every transfer ends with exactly one outcome in the report, and a
/// failing transfer never stops the others.
class Copier {
public:
    Copier(Router& router, CopierOptions options, ProgressSink& progress);

    /// Plan and copy every transfer. Returns once every task has settled.
    CopyReport run(const std::vector<TransferSpec>& transfers);
    CopyReport run(const std::vector<TransferSpec>& transfers, const CancellationToken& token);

    /// Copy already planned tasks. Each task's transfer_index refers into
    /// `transfers`; a transfer without tasks succeeds.
    CopyReport run_tasks(const std::vector<TransferSpec>& transfers,
                         std::vector<CopyTask> tasks, const CancellationToken& token);

    /// Optional metrics sink (not owned)
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Highest number of tasks seen moving bytes at once in the last run
    size_t peak_active_tasks() const { return peak_active_.load(); }

    const CopierOptions& options() const { return options_; }

private:
    struct Batch;

    template <typename Seed>
    CopyReport execute(const std::vector<TransferSpec>& transfers,
                       const CancellationToken& token, Seed seed);

    void plan_transfer(Batch& batch, WorkerPool& pool, size_t index);
    void submit(Batch& batch, WorkerPool& pool, size_t index, std::vector<CopyTask> tasks);

    void run_copy(Batch& batch, WorkerPool& pool, const CopyTask& task);
    void run_finalize(Batch& batch, const CopyTask& task);

    Status copy_range(Batch& batch, const CopyTask& task, MultipartUpload* upload,
                      uint64_t& moved);

    void settle_copy(Batch& batch, WorkerPool& pool, const CopyTask& task,
                     const Status& result, uint64_t moved);
    void maybe_record(Batch& batch, size_t index);

    void wait_for_batch(Batch& batch, WorkerPool& pool);

    void task_started();
    void task_finished();

    Router& router_;
    CopierOptions options_;
    ProgressSink& progress_;
    MetricsExporter* metrics_ = nullptr;

    std::atomic<size_t> active_{0};
    std::atomic<size_t> peak_active_{0};
};

} // namespace bulkcp
