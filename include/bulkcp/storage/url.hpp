#pragma once

#include <optional>
#include <string>

namespace bulkcp::url {

/// Scheme of a URL ("s3", "gs", "file", ...). Empty for a plain local path.
std::string scheme(const std::string& u);

/// Local filesystem path for a file:// URL or a bare path.
std::string local_path(const std::string& u);

/// Remove trailing '/' characters, keeping a lone "/" and "scheme://host".
std::string strip_trailing_slash(const std::string& u);

/// Append a relative path to a base URL with exactly one separator.
std::string join(const std::string& base, const std::string& rel);

/// Last path component, ignoring a trailing '/'.
std::string basename(const std::string& u);

/// Everything before the last path component.
std::string parent(const std::string& u);

/// Path of `child` relative to the directory `prefix`, or nullopt when
/// `child` does not live under it.
std::optional<std::string> relative_to(const std::string& prefix, const std::string& child);

/// Parsed address of an object in a bucket/container style store.
///   s3://bucket/key
///   gs://bucket/key
///   hail-az://account/container/blob
///   https://account.blob.core.windows.net/container/blob
struct ObjectLocation {
    std::string scheme;
    std::string account;   // Azure only
    std::string bucket;    // bucket or container
    std::string key;       // object name, no leading '/'

    /// URL of another key in the same bucket, in the same form as the input.
    std::string to_url(const std::string& other_key) const;
};

std::optional<ObjectLocation> parse_object_location(const std::string& u);

} // namespace bulkcp::url
