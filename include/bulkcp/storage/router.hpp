#pragma once

#include "bulkcp/storage/backend.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace bulkcp {

// Parameters for one backend type, e.g. {"region": "us-west-2"}
using BackendParams = std::map<std::string, std::string>;

struct ResolveResult : Status {
    StorageBackend* backend = nullptr;
};

// Maps a URL's scheme to a storage backend and exposes one uniform surface
// keyed by URL. Backends are created on first use, one per backend type, and
// closed when the router is destroyed.
class Router {
public:
    explicit Router(std::map<std::string, BackendParams> params = {});
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // "local", "gcs", "s3", "azure", or "" for an unsupported scheme
    static std::string backend_type_for(const std::string& url);

    // Serve `scheme` from an explicit backend instead of the built-in mapping
    void register_backend(const std::string& scheme, std::unique_ptr<StorageBackend> backend);

    ResolveResult resolve(const std::string& url);

    StatResult stat(const std::string& url);
    ListResult list_recursive(const std::string& url);
    OpenReadResult open_read(const std::string& url, uint64_t offset,
                             std::optional<uint64_t> length);
    OpenWriteResult open_write(const std::string& url, const WriteOptions& options);
    MultipartResult create_multipart(const std::string& url,
                                     const std::vector<uint64_t>& part_sizes,
                                     const WriteOptions& options);

    // Close every backend created so far; further calls recreate them
    void close();

private:
    template <typename Result, typename Op>
    Result dispatch(const std::string& url, const char* what, Op op);

    std::map<std::string, BackendParams> params_;

    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<StorageBackend>> overrides_;  // by scheme
    std::map<std::string, std::unique_ptr<StorageBackend>> backends_;   // by type
};

} // namespace bulkcp
