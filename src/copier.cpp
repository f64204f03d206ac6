#include "bulkcp/copier.hpp"
#include "bulkcp/core/log.hpp"
#include "bulkcp/metrics.hpp"
#include "bulkcp/planner.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace bulkcp {

namespace {

struct TransferState {
    bool planned = false;
    size_t outstanding = 0;  // tasks not yet settled, finalize tasks included
    bool failed = false;
    ErrorCode error = ErrorCode::None;
    std::string error_message;
    uint64_t attempted = 0;  // whole files plus split objects
    uint64_t files = 0;
    uint64_t bytes = 0;
    bool recorded = false;
};

// One split object. The part that settles last posts the finalize task.
struct ObjectState {
    std::unique_ptr<MultipartUpload> upload;
    size_t parts_remaining = 0;
    bool any_failed = false;
    CopyTask finalize;
};

using ObjectKey = std::pair<size_t, size_t>;  // (transfer_index, file_index)

Status cancelled_status() {
    return Status::failure(ErrorCode::Cancelled, "transfer cancelled");
}

Status skipped_status() {
    return Status::failure(ErrorCode::Cancelled, "skipped after an earlier failure");
}

// First failure wins
void mark_failed(TransferState& state, const Status& cause) {
    if (state.failed) return;
    state.failed = true;
    state.error = cause.error;
    state.error_message = cause.error_message;
}

} // namespace

struct Copier::Batch {
    Batch(const std::vector<TransferSpec>& transfer_specs, const CancellationToken& cancel,
          size_t limit)
        : specs(transfer_specs)
        , report(transfer_specs)
        , token(cancel)
        , semaphore(limit)
        , transfers(transfer_specs.size()) {}

    const std::vector<TransferSpec>& specs;
    CopyReport report;
    const CancellationToken& token;
    CountingSemaphore semaphore;

    std::mutex mutex;
    std::vector<TransferState> transfers;
    std::map<ObjectKey, ObjectState> objects;
};

Copier::Copier(Router& router, CopierOptions options, ProgressSink& progress)
    : router_(router)
    , options_(options)
    , progress_(progress) {
    if (options_.max_simultaneous_transfers == 0) options_.max_simultaneous_transfers = 1;
    if (options_.chunk_size == 0) options_.chunk_size = constants::DEFAULT_CHUNK_SIZE;
}

// ============================================================================
// Entry points
// ============================================================================

CopyReport Copier::run(const std::vector<TransferSpec>& transfers) {
    CancellationToken token;
    return run(transfers, token);
}

CopyReport Copier::run(const std::vector<TransferSpec>& transfers,
                       const CancellationToken& token) {
    return execute(transfers, token, [this, &transfers](Batch& batch, WorkerPool& pool) {
        for (size_t i = 0; i < transfers.size(); ++i) {
            pool.execute([this, &batch, &pool, i] { plan_transfer(batch, pool, i); });
        }
    });
}

CopyReport Copier::run_tasks(const std::vector<TransferSpec>& transfers,
                             std::vector<CopyTask> tasks, const CancellationToken& token) {
    return execute(transfers, token, [&](Batch& batch, WorkerPool& pool) {
        std::vector<std::vector<CopyTask>> grouped(transfers.size());
        for (auto& task : tasks) {
            if (task.transfer_index >= transfers.size()) {
                log_warn("Dropping %s task for unknown transfer %zu",
                         task_kind_name(task.kind), task.transfer_index);
                continue;
            }
            grouped[task.transfer_index].push_back(std::move(task));
        }

        for (size_t i = 0; i < grouped.size(); ++i) {
            ProgressDelta discovered;
            for (const auto& task : grouped[i]) {
                if (task.kind != TaskKind::Part) {
                    discovered.files++;
                    discovered.bytes += task.object_size;
                }
            }
            progress_.on_discovered(discovered);
            submit(batch, pool, i, std::move(grouped[i]));
        }
    });
}

template <typename Seed>
CopyReport Copier::execute(const std::vector<TransferSpec>& transfers,
                           const CancellationToken& token, Seed seed) {
    active_ = 0;
    peak_active_ = 0;

    Batch batch(transfers, token, options_.max_simultaneous_transfers);
    batch.report.mark_started();

    size_t threads = options_.worker_threads ? options_.worker_threads
                                             : options_.max_simultaneous_transfers;
    log_info("Copying %zu transfers: %zu workers, at most %zu active tasks",
             transfers.size(), threads, options_.max_simultaneous_transfers);
    {
        WorkerPool pool(threads);
        seed(batch, pool);
        wait_for_batch(batch, pool);
        pool.shutdown(true);
    }

    // A transfer the pool never settled would otherwise be missing from the report
    for (size_t i = 0; i < transfers.size(); ++i) {
        std::lock_guard lock(batch.mutex);
        auto& state = batch.transfers[i];
        if (state.recorded) continue;
        state.recorded = true;
        log_error("Transfer %zu (%s) did not settle", i, transfers[i].source().c_str());

        TransferOutcome outcome;
        outcome.transfer_index = i;
        outcome.spec = transfers[i];
        outcome.success = false;
        outcome.error = ErrorCode::Unknown;
        outcome.error_message = "transfer did not settle";
        outcome.files_attempted = state.attempted;
        outcome.files = state.files;
        outcome.bytes = state.bytes;
        batch.report.record(std::move(outcome));
    }

    batch.report.mark_finished();
    return std::move(batch.report);
}

void Copier::wait_for_batch(Batch& batch, WorkerPool& pool) {
    while (!pool.wait_idle_for(std::chrono::milliseconds(100))) {
        if (!batch.token.cancelled()) continue;

        log_info("Cancellation requested, waiting up to %llds for in-flight tasks",
                 static_cast<long long>(options_.cancel_grace.count()));
        if (!pool.wait_idle_for(options_.cancel_grace)) {
            log_warn("%zu tasks still in flight %llds after cancellation, waiting for them to stop",
                     active_.load(), static_cast<long long>(options_.cancel_grace.count()));
            pool.wait_idle();
        }
        return;
    }
}

// ============================================================================
// Planning
// ============================================================================

void Copier::plan_transfer(Batch& batch, WorkerPool& pool, size_t index) {
    const auto& spec = batch.specs[index];

    PlanResult plan;
    if (batch.token.cancelled()) {
        plan.fail_from(cancelled_status());
    } else {
        try {
            Planner planner(router_, PlannerOptions{options_.part_size});
            plan = planner.expand(spec, index);
        } catch (const std::exception& e) {
            plan.fail(ErrorCode::Unknown, std::string("planning failed: ") + e.what());
        }
    }

    if (!plan.success) {
        log_info("Cannot copy %s: %s", spec.source().c_str(), plan.describe().c_str());
        {
            std::lock_guard lock(batch.mutex);
            auto& state = batch.transfers[index];
            state.planned = true;
            mark_failed(state, plan);
        }
        maybe_record(batch, index);
        return;
    }

    log_info("Planned %s -> %s: %llu files, %llu bytes, %zu tasks",
             spec.source().c_str(), spec.final_destination().c_str(),
             static_cast<unsigned long long>(plan.files),
             static_cast<unsigned long long>(plan.bytes), plan.tasks.size());
    progress_.on_discovered({plan.files, plan.bytes});
    submit(batch, pool, index, std::move(plan.tasks));
}

void Copier::submit(Batch& batch, WorkerPool& pool, size_t index, std::vector<CopyTask> tasks) {
    // Split objects need their upload before any of their parts can run
    std::map<size_t, CopyTask> finalizers;
    std::map<size_t, std::vector<uint64_t>> part_sizes;
    for (const auto& task : tasks) {
        if (task.kind == TaskKind::Finalize) {
            finalizers[task.file_index] = task;
        } else if (task.kind == TaskKind::Part) {
            auto& sizes = part_sizes[task.file_index];
            if (sizes.size() <= task.part_index) sizes.resize(task.part_index + 1);
            sizes[task.part_index] = task.length;
        }
    }

    std::map<size_t, MultipartResult> uploads;
    for (const auto& [file, finalize] : finalizers) {
        MultipartResult mp;
        if (batch.token.cancelled()) {
            mp.fail_from(cancelled_status());
        } else {
            try {
                mp = router_.create_multipart(finalize.destination, part_sizes[file],
                                              WriteOptions{finalize.create_parents});
            } catch (const std::exception& e) {
                mp.fail(ErrorCode::Unknown, e.what());
            }
        }
        uploads.emplace(file, std::move(mp));
    }

    std::vector<CopyTask> runnable;
    {
        std::lock_guard lock(batch.mutex);
        auto& state = batch.transfers[index];

        std::map<size_t, size_t> parts_posted;
        for (auto& task : tasks) {
            if (task.kind != TaskKind::Part) state.attempted++;
            if (task.kind == TaskKind::Finalize) continue;
            if (task.kind == TaskKind::Part) {
                auto it = uploads.find(task.file_index);
                if (it == uploads.end()) {
                    mark_failed(state, Status::failure(ErrorCode::InvalidTransfer,
                        "part of " + task.source + " has no finalize task"));
                    continue;
                }
                if (!it->second.success) continue;
                parts_posted[task.file_index]++;
            }
            runnable.push_back(std::move(task));
        }

        size_t committing = 0;
        for (auto& [file, mp] : uploads) {
            if (!mp.success) {
                mark_failed(state, mp);
                continue;
            }
            if (parts_posted[file] == 0) {
                mark_failed(state, Status::failure(ErrorCode::InvalidTransfer,
                    "split object " + finalizers[file].destination + " has no parts"));
                continue;
            }
            ObjectState object;
            object.upload = std::move(mp.upload);
            object.parts_remaining = parts_posted[file];
            object.finalize = finalizers[file];
            batch.objects.emplace(ObjectKey{index, file}, std::move(object));
            ++committing;
        }

        state.outstanding += runnable.size() + committing;
        state.planned = true;
    }

    for (const auto& task : runnable) {
        pool.execute([this, &batch, &pool, task] { run_copy(batch, pool, task); });
    }
    maybe_record(batch, index);
}

// ============================================================================
// Execution
// ============================================================================

void Copier::run_copy(Batch& batch, WorkerPool& pool, const CopyTask& task) {
    MultipartUpload* upload = nullptr;
    bool skip = false;
    {
        std::lock_guard lock(batch.mutex);
        skip = batch.transfers[task.transfer_index].failed;
        if (task.kind == TaskKind::Part) {
            auto it = batch.objects.find({task.transfer_index, task.file_index});
            if (it == batch.objects.end()) {
                skip = true;
            } else {
                upload = it->second.upload.get();
                skip = skip || it->second.any_failed;
            }
        }
    }

    Status result;
    uint64_t moved = 0;
    if (skip) {
        result = skipped_status();
    } else if (!batch.semaphore.acquire(batch.token)) {
        result = cancelled_status();
    } else {
        SemaphoreGuard slot(batch.semaphore);
        task_started();
        try {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->task_duration());
            result = copy_range(batch, task, upload, moved);
        } catch (const std::exception& e) {
            result = Status::failure(ErrorCode::Unknown, e.what());
        }
        task_finished();
    }

    settle_copy(batch, pool, task, result, moved);
}

Status Copier::copy_range(Batch& batch, const CopyTask& task, MultipartUpload* upload,
                          uint64_t& moved) {
    auto reader = router_.open_read(task.source, task.offset, task.length);
    if (!reader.success) return reader;

    OpenWriteResult writer = upload
        ? upload->open_part(task.part_index)
        : router_.open_write(task.destination, WriteOptions{task.create_parents, task.length});
    if (!writer.success) return writer;

    auto& in = *reader.stream;
    auto& out = *writer.stream;
    std::vector<uint8_t> buffer(static_cast<size_t>(
        std::clamp<uint64_t>(task.length, 1, options_.chunk_size)));

    while (true) {
        if (batch.token.cancelled()) {
            out.abort();
            return cancelled_status();
        }

        auto r = in.read(buffer);
        if (!r.success) {
            out.abort();
            return r;
        }
        if (r.bytes == 0) break;

        auto w = out.write(std::span<const uint8_t>(buffer.data(), r.bytes));
        if (!w.success) {
            out.abort();
            return w;
        }

        moved += r.bytes;
        progress_.on_progress({0, r.bytes});
        if (metrics_) metrics_->bytes_total().Increment(static_cast<double>(r.bytes));
    }

    // The source shrank after planning
    if (moved != task.length) {
        out.abort();
        return Status::failure(ErrorCode::PartSizeMismatch,
                               "read " + std::to_string(moved) + " of " +
                               std::to_string(task.length) + " bytes from " + task.source);
    }

    Status closed = out.close();
    if (!closed.success) out.abort();
    return closed;
}

void Copier::settle_copy(Batch& batch, WorkerPool& pool, const CopyTask& task,
                         const Status& result, uint64_t moved) {
    std::optional<CopyTask> finalize;
    std::unique_ptr<MultipartUpload> abandoned;
    bool file_done = false;
    {
        std::lock_guard lock(batch.mutex);
        auto& state = batch.transfers[task.transfer_index];
        state.bytes += moved;
        if (!result.success) mark_failed(state, result);

        if (task.kind == TaskKind::Whole && result.success) {
            state.files++;
            file_done = true;
        }

        if (task.kind == TaskKind::Part) {
            auto it = batch.objects.find({task.transfer_index, task.file_index});
            if (it != batch.objects.end()) {
                auto& object = it->second;
                if (!result.success) object.any_failed = true;
                if (--object.parts_remaining == 0) {
                    if (!object.any_failed && !state.failed) {
                        finalize = object.finalize;
                    } else {
                        // The finalize task settles here without running
                        abandoned = std::move(object.upload);
                        batch.objects.erase(it);
                        --state.outstanding;
                    }
                }
            }
        }

        --state.outstanding;
    }

    if (metrics_) {
        metrics_->tasks(task.kind, result.success).Increment();
        if (file_done) metrics_->files_total().Increment();
    }
    if (file_done) {
        log_info("Copied %s -> %s", task.source.c_str(), task.destination.c_str());
        progress_.on_progress({1, 0});
    }
    if (abandoned) {
        log_info("Abandoning split upload of %s", task.destination.c_str());
        abandoned->abort();
    }
    if (finalize) {
        CopyTask commit = std::move(*finalize);
        pool.execute([this, &batch, commit] { run_finalize(batch, commit); });
    }

    maybe_record(batch, task.transfer_index);
}

void Copier::run_finalize(Batch& batch, const CopyTask& task) {
    std::unique_ptr<MultipartUpload> upload;
    bool skip = false;
    {
        std::lock_guard lock(batch.mutex);
        auto it = batch.objects.find({task.transfer_index, task.file_index});
        if (it != batch.objects.end()) {
            upload = std::move(it->second.upload);
            batch.objects.erase(it);
        }
        skip = batch.transfers[task.transfer_index].failed;
    }

    Status result;
    if (!upload) {
        result = Status::failure(ErrorCode::Unknown,
                                 "no upload in progress for " + task.destination);
    } else if (skip) {
        result = skipped_status();
    } else if (!batch.semaphore.acquire(batch.token)) {
        result = cancelled_status();
    } else {
        SemaphoreGuard slot(batch.semaphore);
        task_started();
        try {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->task_duration());
            result = upload->complete();
        } catch (const std::exception& e) {
            result = Status::failure(ErrorCode::Unknown, e.what());
        }
        task_finished();
    }

    if (!result.success && upload) upload->abort();

    {
        std::lock_guard lock(batch.mutex);
        auto& state = batch.transfers[task.transfer_index];
        if (result.success) {
            state.files++;
        } else {
            mark_failed(state, result);
        }
        --state.outstanding;
    }

    if (metrics_) {
        metrics_->tasks(TaskKind::Finalize, result.success).Increment();
        if (result.success) metrics_->files_total().Increment();
    }
    if (result.success) {
        log_info("Committed %s (%zu parts)", task.destination.c_str(), task.part_count);
        progress_.on_progress({1, 0});
    }

    maybe_record(batch, task.transfer_index);
}

// ============================================================================
// Bookkeeping
// ============================================================================

void Copier::maybe_record(Batch& batch, size_t index) {
    TransferOutcome outcome;
    {
        std::lock_guard lock(batch.mutex);
        auto& state = batch.transfers[index];
        if (!state.planned || state.outstanding > 0 || state.recorded) return;
        state.recorded = true;

        outcome.transfer_index = index;
        outcome.spec = batch.specs[index];
        outcome.success = !state.failed;
        outcome.error = state.error;
        outcome.error_message = state.error_message;
        outcome.files_attempted = state.attempted;
        outcome.files = state.files;
        outcome.bytes = state.bytes;
    }

    if (outcome.success) {
        log_info("Finished %s -> %s: %llu files, %s",
                 outcome.spec.source().c_str(), outcome.spec.final_destination().c_str(),
                 static_cast<unsigned long long>(outcome.files),
                 format_bytes(outcome.bytes).c_str());
    } else {
        log_info("Failed %s -> %s: %s: %s",
                 outcome.spec.source().c_str(), outcome.spec.final_destination().c_str(),
                 error_code_name(outcome.error), outcome.error_message.c_str());
    }
    if (metrics_) {
        (outcome.success ? metrics_->transfers_success() : metrics_->transfers_failure()).Increment();
    }

    batch.report.record(std::move(outcome));
}

void Copier::task_started() {
    size_t now = active_.fetch_add(1) + 1;
    size_t peak = peak_active_.load();
    while (now > peak && !peak_active_.compare_exchange_weak(peak, now)) {
    }
    if (metrics_) metrics_->active_tasks().Increment();
}

void Copier::task_finished() {
    active_.fetch_sub(1);
    if (metrics_) metrics_->active_tasks().Decrement();
}

} // namespace bulkcp
