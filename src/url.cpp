#include "bulkcp/storage/url.hpp"

namespace bulkcp::url {

static const std::string AZURE_HOST_SUFFIX = ".blob.core.windows.net";

std::string scheme(const std::string& u) {
    auto pos = u.find("://");
    if (pos == std::string::npos) return "";
    return u.substr(0, pos);
}

std::string local_path(const std::string& u) {
    if (u.rfind("file://", 0) == 0) {
        return u.substr(7);
    }
    return u;
}

std::string strip_trailing_slash(const std::string& u) {
    size_t min_len = 1;
    auto sep = u.find("://");
    if (sep != std::string::npos) {
        min_len = sep + 3;
    }
    std::string result = u;
    while (result.size() > min_len && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

std::string join(const std::string& base, const std::string& rel) {
    size_t start = 0;
    while (start < rel.size() && rel[start] == '/') ++start;
    if (start == rel.size()) return base;

    std::string b = strip_trailing_slash(base);
    if (!b.empty() && b.back() != '/') b += '/';
    return b + rel.substr(start);
}

std::string basename(const std::string& u) {
    std::string s = strip_trailing_slash(u);
    auto sep = s.find("://");
    size_t floor = sep == std::string::npos ? 0 : sep + 3;
    auto slash = s.rfind('/');
    if (slash == std::string::npos || slash < floor) {
        return s.substr(floor);
    }
    return s.substr(slash + 1);
}

std::string parent(const std::string& u) {
    std::string s = strip_trailing_slash(u);
    auto sep = s.find("://");
    size_t floor = sep == std::string::npos ? 0 : sep + 3;
    auto slash = s.rfind('/');
    if (slash == std::string::npos || slash < floor) {
        return "";
    }
    if (slash == 0) return "/";
    return s.substr(0, slash);
}

std::optional<std::string> relative_to(const std::string& prefix, const std::string& child) {
    std::string p = strip_trailing_slash(prefix);
    if (!p.empty() && p.back() != '/') p += '/';
    if (child.size() <= p.size() || child.compare(0, p.size(), p) != 0) {
        return std::nullopt;
    }
    return child.substr(p.size());
}

// ============================================================================
// ObjectLocation
// ============================================================================

std::string ObjectLocation::to_url(const std::string& other_key) const {
    if (scheme == "https") {
        return "https://" + account + AZURE_HOST_SUFFIX + "/" + bucket + "/" + other_key;
    }
    if (scheme == "hail-az") {
        return "hail-az://" + account + "/" + bucket + "/" + other_key;
    }
    return scheme + "://" + bucket + "/" + other_key;
}

// Split "first/rest" at the first '/'
static std::pair<std::string, std::string> split_first(const std::string& s) {
    auto slash = s.find('/');
    if (slash == std::string::npos) return {s, ""};
    return {s.substr(0, slash), s.substr(slash + 1)};
}

std::optional<ObjectLocation> parse_object_location(const std::string& u) {
    auto sep = u.find("://");
    if (sep == std::string::npos) return std::nullopt;

    ObjectLocation loc;
    loc.scheme = u.substr(0, sep);
    std::string rest = u.substr(sep + 3);

    if (loc.scheme == "s3" || loc.scheme == "gs") {
        auto [bucket, key] = split_first(rest);
        if (bucket.empty()) return std::nullopt;
        loc.bucket = bucket;
        loc.key = key;
        return loc;
    }

    if (loc.scheme == "hail-az") {
        auto [account, tail] = split_first(rest);
        auto [container, blob] = split_first(tail);
        if (account.empty() || container.empty()) return std::nullopt;
        loc.account = account;
        loc.bucket = container;
        loc.key = blob;
        return loc;
    }

    if (loc.scheme == "https") {
        auto [host, tail] = split_first(rest);
        if (host.size() <= AZURE_HOST_SUFFIX.size() ||
            host.compare(host.size() - AZURE_HOST_SUFFIX.size(), AZURE_HOST_SUFFIX.size(),
                         AZURE_HOST_SUFFIX) != 0) {
            return std::nullopt;
        }
        auto [container, blob] = split_first(tail);
        if (container.empty()) return std::nullopt;
        loc.account = host.substr(0, host.size() - AZURE_HOST_SUFFIX.size());
        loc.bucket = container;
        loc.key = blob;
        return loc;
    }

    return std::nullopt;
}

} // namespace bulkcp::url
