#pragma once

#include "bulkcp/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bulkcp {

enum class Disposition {
    OntoPath,       // destination names the final object
    IntoDirectory   // final object is destination/basename(source)
};

const char* disposition_name(Disposition disposition);

// One requested copy. Immutable once constructed.
class TransferSpec {
public:
    TransferSpec(std::string source, std::string destination, Disposition disposition);

    const std::string& source() const { return source_; }
    const std::string& destination() const { return destination_; }
    Disposition disposition() const { return disposition_; }

    // Path the source lands at, after applying the disposition
    std::string final_destination() const;

    bool operator==(const TransferSpec& other) const {
        return source_ == other.source_ && destination_ == other.destination_ &&
               disposition_ == other.disposition_;
    }

private:
    std::string source_;
    std::string destination_;
    Disposition disposition_;
};

struct ParseTransfersResult : Status {
    std::vector<TransferSpec> transfers;
};

// Parse a JSON array of {"from": ..., "to": ...} / {"from": ..., "into": ...}
// objects. Each object must name exactly one of "to" and "into".
ParseTransfersResult parse_transfers(const std::string& json);

enum class TaskKind {
    Whole,    // copy a complete object
    Part,     // copy one byte range of a split object
    Finalize  // commit a split object once every part has landed
};

const char* task_kind_name(TaskKind kind);

// Unit of scheduled work. `transfer_index` refers back to the TransferSpec in
// the batch; the batch owns the spec, the task only points at it.
struct CopyTask {
    TaskKind kind = TaskKind::Whole;
    size_t transfer_index = 0;
    size_t file_index = 0;     // distinguishes the files of one directory transfer

    std::string source;
    std::string destination;

    uint64_t offset = 0;
    uint64_t length = 0;
    size_t part_index = 0;
    size_t part_count = 1;
    uint64_t object_size = 0;

    bool create_parents = false;
};

} // namespace bulkcp
