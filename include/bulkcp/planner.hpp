#pragma once

#include "bulkcp/core/constants.hpp"
#include "bulkcp/core/error.hpp"
#include "bulkcp/storage/router.hpp"
#include "bulkcp/transfer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bulkcp {

struct PlannerOptions {
    // Objects larger than this are copied as parallel parts
    uint64_t part_size = constants::DEFAULT_PART_SIZE;
};

struct PlanResult : Status {
    std::vector<CopyTask> tasks;
    uint64_t files = 0;
    uint64_t bytes = 0;
};

// Expands a TransferSpec into CopyTasks using the router's stat and list.
class Planner {
public:
    Planner(Router& router, PlannerOptions options);

    PlanResult expand(const TransferSpec& spec, size_t transfer_index);

    // One Whole task, or ceil(size / part_size) Part tasks followed by one
    // Finalize task. The last part carries the remainder.
    static std::vector<CopyTask> split_object(const std::string& source,
                                              const std::string& destination,
                                              uint64_t size, uint64_t part_size,
                                              size_t transfer_index, size_t file_index,
                                              bool create_parents);

    const PlannerOptions& options() const { return options_; }

private:
    PlanResult expand_file(const TransferSpec& spec, size_t transfer_index, uint64_t size);
    PlanResult expand_directory(const TransferSpec& spec, size_t transfer_index);

    Router& router_;
    PlannerOptions options_;
};

} // namespace bulkcp
