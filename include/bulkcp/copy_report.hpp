#pragma once

#include "bulkcp/core/error.hpp"
#include "bulkcp/transfer.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace bulkcp {

enum class OverallStatus {
    Success,
    PartialFailure
};

const char* overall_status_name(OverallStatus status);

// Settled result of one TransferSpec
struct TransferOutcome {
    size_t transfer_index = 0;
    TransferSpec spec{"", "", Disposition::OntoPath};
    bool success = true;
    ErrorCode error = ErrorCode::None;
    std::string error_message;

    uint64_t files_attempted = 0;  // files the plan scheduled
    uint64_t files = 0;            // files fully copied
    uint64_t bytes = 0;  // bytes moved, including those of failed files
};

/// Per-transfer outcomes of one batch, kept in input order regardless of
/// completion order. Each transfer is recorded exactly once.
class CopyReport {
public:
    explicit CopyReport(std::vector<TransferSpec> transfers);

    CopyReport(CopyReport&& other) noexcept;
    CopyReport& operator=(CopyReport&&) = delete;
    CopyReport(const CopyReport&) = delete;
    CopyReport& operator=(const CopyReport&) = delete;

    /// False (and ignored) if the transfer already has an outcome or the
    /// index is out of range.
    bool record(TransferOutcome outcome);

    void mark_started();
    void mark_finished();

    /// Settled outcomes in input order
    std::vector<TransferOutcome> outcomes() const;

    size_t transfer_count() const { return transfers_.size(); }
    size_t succeeded() const;
    size_t failed() const;
    uint64_t total_files() const;
    uint64_t total_files_attempted() const;
    uint64_t total_bytes() const;
    std::chrono::duration<double> elapsed() const;

    /// True once every transfer has an outcome
    bool complete() const;

    OverallStatus overall_status() const;

    /// Human-readable summary; failed transfers are listed with their cause
    std::string summarize() const;
    void summarize(std::ostream& out) const;

private:
    std::vector<TransferSpec> transfers_;
    std::vector<std::optional<TransferOutcome>> slots_;

    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point finished_;
    bool has_started_ = false;
    bool has_finished_ = false;

    mutable std::mutex mutex_;
};

} // namespace bulkcp
