#include "bulkcp/storage/router.hpp"
#include "bulkcp/storage/url.hpp"
#include "bulkcp/core/log.hpp"

#include <exception>

namespace bulkcp {

Router::Router(std::map<std::string, BackendParams> params)
    : params_(std::move(params)) {}

Router::~Router() {
    close();
}

std::string Router::backend_type_for(const std::string& u) {
    auto scheme = url::scheme(u);
    if (scheme.empty() || scheme == "file") return "local";
    if (scheme == "gs") return "gcs";
    if (scheme == "s3") return "s3";
    if (scheme == "hail-az" || scheme == "https") return "azure";
    return "";
}

void Router::register_backend(const std::string& scheme, std::unique_ptr<StorageBackend> backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[scheme] = std::move(backend);
}

ResolveResult Router::resolve(const std::string& u) {
    ResolveResult result;
    auto scheme = url::scheme(u);

    std::lock_guard<std::mutex> lock(mutex_);

    auto override_it = overrides_.find(scheme);
    if (override_it != overrides_.end()) {
        result.backend = override_it->second.get();
        return result;
    }

    auto type = backend_type_for(u);
    if (type.empty()) {
        result.fail(ErrorCode::UnsupportedBackend, "no storage backend for scheme '" + scheme + "': " + u);
        return result;
    }

    auto it = backends_.find(type);
    if (it == backends_.end()) {
        BackendParams params;
        auto params_it = params_.find(type);
        if (params_it != params_.end()) {
            params = params_it->second;
        }

        try {
            auto backend = StorageBackendFactory::create(type, params);
            log_info("created %s storage backend", type.c_str());
            it = backends_.emplace(type, std::move(backend)).first;
        } catch (const std::exception& e) {
            result.fail(ErrorCode::UnsupportedBackend,
                        "cannot create " + type + " backend: " + e.what());
            return result;
        }
    }

    result.backend = it->second.get();
    return result;
}

template <typename Result, typename Op>
Result Router::dispatch(const std::string& u, const char* what, Op op) {
    Result result;
    auto resolved = resolve(u);
    if (!resolved.success) {
        result.fail_from(resolved);
        return result;
    }

    // Nothing thrown by a backend may unwind the batch
    try {
        return op(*resolved.backend);
    } catch (const std::exception& e) {
        result.fail(ErrorCode::Unknown, std::string(what) + " " + u + ": " + e.what());
    }
    return result;
}

StatResult Router::stat(const std::string& u) {
    return dispatch<StatResult>(u, "stat", [&](StorageBackend& b) { return b.stat(u); });
}

ListResult Router::list_recursive(const std::string& u) {
    return dispatch<ListResult>(u, "list", [&](StorageBackend& b) { return b.list_recursive(u); });
}

OpenReadResult Router::open_read(const std::string& u, uint64_t offset,
                                 std::optional<uint64_t> length) {
    return dispatch<OpenReadResult>(u, "open", [&](StorageBackend& b) {
        return b.open_read(u, offset, length);
    });
}

OpenWriteResult Router::open_write(const std::string& u, const WriteOptions& options) {
    return dispatch<OpenWriteResult>(u, "create", [&](StorageBackend& b) {
        return b.open_write(u, options);
    });
}

MultipartResult Router::create_multipart(const std::string& u,
                                         const std::vector<uint64_t>& part_sizes,
                                         const WriteOptions& options) {
    return dispatch<MultipartResult>(u, "create", [&](StorageBackend& b) {
        return b.create_multipart(u, part_sizes, options);
    });
}

void Router::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [type, backend] : backends_) {
        try {
            backend->close();
        } catch (const std::exception& e) {
            log_warn("error closing %s backend: %s", type.c_str(), e.what());
        }
    }
    backends_.clear();
    for (auto& [scheme, backend] : overrides_) {
        try {
            backend->close();
        } catch (const std::exception& e) {
            log_warn("error closing %s backend: %s", scheme.c_str(), e.what());
        }
    }
}

} // namespace bulkcp
