#include "bulkcp/planner.hpp"
#include "bulkcp/storage/url.hpp"
#include "bulkcp/core/log.hpp"

namespace bulkcp {

Planner::Planner(Router& router, PlannerOptions options)
    : router_(router)
    , options_(options) {}

std::vector<CopyTask> Planner::split_object(const std::string& source,
                                            const std::string& destination,
                                            uint64_t size, uint64_t part_size,
                                            size_t transfer_index, size_t file_index,
                                            bool create_parents) {
    std::vector<CopyTask> tasks;

    CopyTask base;
    base.transfer_index = transfer_index;
    base.file_index = file_index;
    base.source = source;
    base.destination = destination;
    base.object_size = size;
    base.create_parents = create_parents;

    if (part_size == 0 || size <= part_size) {
        CopyTask task = base;
        task.kind = TaskKind::Whole;
        task.length = size;
        tasks.push_back(std::move(task));
        return tasks;
    }

    size_t part_count = static_cast<size_t>((size + part_size - 1) / part_size);
    for (size_t i = 0; i < part_count; ++i) {
        CopyTask task = base;
        task.kind = TaskKind::Part;
        task.part_index = i;
        task.part_count = part_count;
        task.offset = static_cast<uint64_t>(i) * part_size;
        task.length = (i + 1 == part_count) ? size - task.offset : part_size;
        tasks.push_back(std::move(task));
    }

    CopyTask finalize = base;
    finalize.kind = TaskKind::Finalize;
    finalize.part_count = part_count;
    finalize.length = size;
    tasks.push_back(std::move(finalize));
    return tasks;
}

PlanResult Planner::expand(const TransferSpec& spec, size_t transfer_index) {
    PlanResult result;

    auto source = router_.stat(spec.source());
    if (!source.success) {
        result.fail_from(source);
        return result;
    }
    if (source.is_file && source.is_directory) {
        result.fail(ErrorCode::FileAndDirectory,
                    "source is both a file and a directory: " + spec.source());
        return result;
    }

    if (source.is_file) {
        return expand_file(spec, transfer_index, source.size);
    }
    return expand_directory(spec, transfer_index);
}

PlanResult Planner::expand_file(const TransferSpec& spec, size_t transfer_index, uint64_t size) {
    PlanResult result;

    auto dest = router_.stat(spec.destination());
    bool dest_exists = dest.success;
    if (!dest.success && dest.error != ErrorCode::NotFound) {
        result.fail_from(dest);
        return result;
    }

    std::string final_destination = spec.final_destination();
    bool create_parents = false;

    if (spec.disposition() == Disposition::OntoPath) {
        if (dest_exists && dest.is_directory) {
            result.fail(ErrorCode::IsADirectory,
                        "destination is a directory: " + spec.destination());
            return result;
        }
    } else {
        if (dest_exists && dest.is_file && !dest.is_directory) {
            result.fail(ErrorCode::NotADirectory,
                        "destination is not a directory: " + spec.destination());
            return result;
        }
        auto target = router_.stat(final_destination);
        if (target.success && target.is_directory) {
            result.fail(ErrorCode::IsADirectory,
                        "destination is a directory: " + final_destination);
            return result;
        }
        if (!target.success && target.error != ErrorCode::NotFound) {
            result.fail_from(target);
            return result;
        }
        create_parents = true;
    }

    result.tasks = split_object(spec.source(), final_destination, size, options_.part_size,
                                transfer_index, 0, create_parents);
    result.files = 1;
    result.bytes = size;
    return result;
}

PlanResult Planner::expand_directory(const TransferSpec& spec, size_t transfer_index) {
    PlanResult result;

    auto dest = router_.stat(spec.destination());
    if (dest.success && dest.is_file && !dest.is_directory) {
        result.fail(ErrorCode::NotADirectory,
                    "destination is not a directory: " + spec.destination());
        return result;
    }
    if (!dest.success && dest.error != ErrorCode::NotFound) {
        result.fail_from(dest);
        return result;
    }

    auto listing = router_.list_recursive(spec.source());
    if (!listing.success) {
        result.fail_from(listing);
        return result;
    }

    // Children keep their path relative to the source, re-rooted under the
    // destination, and always land exactly there
    std::string root = spec.final_destination();
    size_t file_index = 0;
    for (const auto& entry : listing.entries) {
        auto rel = url::relative_to(spec.source(), entry.url);
        if (!rel) {
            result.fail(ErrorCode::Unknown,
                        "listed " + entry.url + " outside of " + spec.source());
            return result;
        }

        TransferSpec child(entry.url, url::join(root, *rel), Disposition::OntoPath);
        auto tasks = split_object(child.source(), child.destination(), entry.size,
                                  options_.part_size, transfer_index, file_index, true);
        result.tasks.insert(result.tasks.end(),
                            std::make_move_iterator(tasks.begin()),
                            std::make_move_iterator(tasks.end()));
        result.files++;
        result.bytes += entry.size;
        file_index++;
    }

    log_info("%s: %llu files, %llu bytes", spec.source().c_str(),
             static_cast<unsigned long long>(result.files),
             static_cast<unsigned long long>(result.bytes));
    return result;
}

} // namespace bulkcp
