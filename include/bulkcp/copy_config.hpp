#pragma once

#include "bulkcp/copier.hpp"
#include "bulkcp/storage/router.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace bulkcp {

/// Parameters for one backend type (s3, azure, gcs).
struct BackendConfig {
    std::string type;
    BackendParams params;  // Passed to StorageBackendFactory

    /// Validate the parameters set for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for one bulkcp run.
struct CopyConfig {
    // Positional: JSON string or null naming the project billed for
    // requester-pays buckets
    std::string requester_pays_project_json;
    std::string requester_pays_project;  // decoded; empty for null

    // Positional: JSON array of transfers; nullopt reads standard input
    std::optional<std::string> files_json;

    // Scheduler
    size_t max_simultaneous_transfers = constants::DEFAULT_MAX_SIMULTANEOUS_TRANSFERS;
    size_t worker_threads = 0;  // 0 = max_simultaneous_transfers
    uint64_t part_size = constants::DEFAULT_PART_SIZE;
    uint64_t chunk_size = constants::DEFAULT_CHUNK_SIZE;

    // Cancellation
    size_t timeout_secs = 0;  // 0 = no deadline
    size_t cancel_grace_secs = constants::DEFAULT_CANCEL_GRACE_SECONDS;

    bool verbose = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    // Storage backends
    BackendConfig s3{"s3", {}};
    BackendConfig azure{"azure", {}};
    BackendConfig gcs{"gcs", {}};

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<CopyConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in credentials from the environment and decode the
    /// requester-pays project. Explicit settings win.
    void apply_defaults();

    /// Validate settings. Returns error message or empty string.
    std::string validate() const;

    /// Backend parameters keyed by backend type, for the Router
    std::map<std::string, BackendParams> router_params() const;

    CopierOptions copier_options() const;
};

/// Decode the requester-pays positional: a JSON string, or null for none.
/// Returns false and sets `error` for anything else.
bool decode_requester_pays_project(const std::string& json, std::string& project,
                                   std::string& error);

}  // namespace bulkcp
