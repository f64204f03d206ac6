#include "bulkcp/copy_report.hpp"
#include "bulkcp/progress.hpp"

#include <cstdio>
#include <sstream>

namespace bulkcp {

const char* overall_status_name(OverallStatus status) {
    switch (status) {
        case OverallStatus::Success: return "Success";
        case OverallStatus::PartialFailure: return "PartialFailure";
    }
    return "Unknown";
}

CopyReport::CopyReport(std::vector<TransferSpec> transfers)
    : transfers_(std::move(transfers))
    , slots_(transfers_.size()) {}

CopyReport::CopyReport(CopyReport&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.mutex_);
    transfers_ = std::move(other.transfers_);
    slots_ = std::move(other.slots_);
    started_ = other.started_;
    finished_ = other.finished_;
    has_started_ = other.has_started_;
    has_finished_ = other.has_finished_;
}

bool CopyReport::record(TransferOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome.transfer_index >= slots_.size() || slots_[outcome.transfer_index]) {
        return false;
    }
    size_t index = outcome.transfer_index;
    slots_[index] = std::move(outcome);
    return true;
}

void CopyReport::mark_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = std::chrono::steady_clock::now();
    has_started_ = true;
}

void CopyReport::mark_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = std::chrono::steady_clock::now();
    has_finished_ = true;
}

std::vector<TransferOutcome> CopyReport::outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferOutcome> result;
    for (const auto& slot : slots_) {
        if (slot) result.push_back(*slot);
    }
    return result;
}

size_t CopyReport::succeeded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& slot : slots_) {
        if (slot && slot->success) ++n;
    }
    return n;
}

size_t CopyReport::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& slot : slots_) {
        if (slot && !slot->success) ++n;
    }
    return n;
}

uint64_t CopyReport::total_files() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t n = 0;
    for (const auto& slot : slots_) {
        if (slot) n += slot->files;
    }
    return n;
}

uint64_t CopyReport::total_files_attempted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t n = 0;
    for (const auto& slot : slots_) {
        if (slot) n += slot->files_attempted;
    }
    return n;
}

uint64_t CopyReport::total_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t n = 0;
    for (const auto& slot : slots_) {
        if (slot) n += slot->bytes;
    }
    return n;
}

std::chrono::duration<double> CopyReport::elapsed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_started_) return std::chrono::duration<double>(0);
    auto end = has_finished_ ? finished_ : std::chrono::steady_clock::now();
    return end - started_;
}

bool CopyReport::complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& slot : slots_) {
        if (!slot) return false;
    }
    return true;
}

OverallStatus CopyReport::overall_status() const {
    return failed() > 0 ? OverallStatus::PartialFailure : OverallStatus::Success;
}

std::string CopyReport::summarize() const {
    std::ostringstream oss;
    summarize(oss);
    return oss.str();
}

void CopyReport::summarize(std::ostream& out) const {
    auto settled = outcomes();
    size_t ok = succeeded();
    size_t bad = failed();
    uint64_t files = total_files();
    uint64_t attempted = total_files_attempted();
    uint64_t bytes = total_bytes();
    double secs = elapsed().count();

    out << "Transfers: " << transfers_.size() << " total, " << ok << " succeeded, "
        << bad << " failed\n";

    char rate[64];
    double throughput = secs > 0 ? static_cast<double>(bytes) / secs : 0.0;
    std::snprintf(rate, sizeof(rate), "%.2fs (%s/s)", secs,
                  format_bytes(static_cast<uint64_t>(throughput)).c_str());
    out << "Files: " << files << " of " << attempted << " copied, bytes: " << bytes
        << " (" << format_bytes(bytes) << "), elapsed: " << rate << "\n";

    if (bad > 0) {
        out << "Failed transfers:\n";
        for (const auto& o : settled) {
            if (o.success) continue;
            out << "  [" << o.transfer_index << "] " << o.spec.source() << " -> "
                << o.spec.destination() << ": " << error_code_name(o.error) << ": "
                << o.error_message << "\n";
        }
    }
    out << "Status: " << overall_status_name(overall_status()) << "\n";
}

} // namespace bulkcp
