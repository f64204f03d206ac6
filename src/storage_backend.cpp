#include "bulkcp/storage/backend.hpp"
#include "bulkcp/storage/cloud_protocol.hpp"
#include "bulkcp/storage/url.hpp"
#include "bulkcp/core/constants.hpp"
#include "bulkcp/core/log.hpp"
#include "bulkcp/net/http.hpp"

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace bulkcp {

namespace fs = std::filesystem;

// ============================================================================
// Shared helpers
// ============================================================================

static Status errno_failure(int err, const std::string& what) {
    return Status::failure(error_from_errno(err), what + ": " + std::strerror(err));
}

static Status http_failure(const net::Response& response, const std::string& what) {
    return Status::failure(error_from_http_status(response.status, response.network_error()),
                           what + ": " + response.describe());
}

static std::string param(const StorageBackendFactory::Params& params,
                         const std::string& name, const std::string& fallback = "") {
    auto it = params.find(name);
    return it == params.end() ? fallback : it->second;
}

static bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

static uint32_t param_uint(const StorageBackendFactory::Params& params,
                           const std::string& name, uint32_t fallback) {
    auto it = params.find(name);
    if (it == params.end() || it->second.empty()) return fallback;
    try {
        return static_cast<uint32_t>(std::stoul(it->second));
    } catch (const std::exception&) {
        throw std::runtime_error("invalid value for '" + name + "': " + it->second);
    }
}

static net::ClientOptions client_options(const StorageBackendFactory::Params& params,
                                         const std::string& agent) {
    net::ClientOptions options;
    options.user_agent = agent;
    options.verify_ssl = parse_bool(param(params, "verify_ssl", "true"));
    options.ca_bundle = param(params, "ca_bundle");
    options.connect_timeout = std::chrono::seconds(
        param_uint(params, "connect_timeout", constants::DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS));
    options.request_timeout = std::chrono::seconds(
        param_uint(params, "request_timeout", constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS));
    options.max_retries = static_cast<int>(
        param_uint(params, "max_retries", constants::DEFAULT_HTTP_MAX_RETRIES));
    return options;
}

// Object store writes stream with a fixed Content-Length
static std::optional<uint64_t> upload_size(const WriteOptions& options, const std::string& url,
                                           Status& status) {
    if (!options.size) {
        status.fail(ErrorCode::InvalidTransfer, "object size must be known to upload " + url);
    }
    return options.size;
}

static void attach_body(net::Request& request, BodyPipe& pipe, uint64_t size) {
    request.body_source = [&pipe](uint8_t* dst, size_t max) { return pipe.pull(dst, max); };
    request.body_length = size;
}

// ============================================================================
// SecureString - zeroes credential memory on destruction
// ============================================================================

class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string s) : data_(std::move(s)) {}

    SecureString(const SecureString& other) : data_(other.data_) {}
    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            secure_clear();
            data_ = other.data_;
        }
        return *this;
    }

    ~SecureString() { secure_clear(); }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void secure_clear() {
        if (!data_.empty()) {
            volatile char* p = const_cast<volatile char*>(data_.data());
            size_t len = data_.size();
            while (len--) {
                *p++ = 0;
            }
            data_.clear();
        }
    }

    std::string data_;
};

// ============================================================================
// MultipartUpload
// ============================================================================

MultipartUpload::MultipartUpload(std::vector<uint64_t> part_sizes)
    : planned_sizes_(std::move(part_sizes))
    , committed_sizes_(planned_sizes_.size()) {}

uint64_t MultipartUpload::part_offset(size_t index) const {
    uint64_t offset = 0;
    for (size_t i = 0; i < index && i < planned_sizes_.size(); ++i) {
        offset += planned_sizes_[i];
    }
    return offset;
}

void MultipartUpload::record_part(size_t index, uint64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index < committed_sizes_.size()) {
        committed_sizes_[index] = size;
    }
}

Status MultipartUpload::check_part_sizes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < planned_sizes_.size(); ++i) {
        if (!committed_sizes_[i]) {
            return Status::failure(ErrorCode::PartSizeMismatch,
                                   "part " + std::to_string(i) + " was never written");
        }
        if (*committed_sizes_[i] != planned_sizes_[i]) {
            return Status::failure(ErrorCode::PartSizeMismatch,
                                   "part " + std::to_string(i) + " has " +
                                   std::to_string(*committed_sizes_[i]) + " bytes, expected " +
                                   std::to_string(planned_sizes_[i]));
        }
    }
    return Status::ok();
}

// ============================================================================
// RangedReadStream / BodyPipe / StreamingWriteStream
// ============================================================================

RangedReadStream::RangedReadStream(Fetch fetch, uint64_t offset, std::optional<uint64_t> length)
    : fetch_(std::move(fetch))
    , position_(offset)
    , remaining_(length) {}

IoResult RangedReadStream::read(std::span<uint8_t> buffer) {
    IoResult result;
    if (eof_ || buffer.empty()) return result;

    uint64_t want = buffer.size();
    if (remaining_) {
        if (*remaining_ == 0) {
            eof_ = true;
            return result;
        }
        want = std::min<uint64_t>(want, *remaining_);
    }

    auto fetched = fetch_(position_, want);
    if (!fetched.success) {
        result.fail_from(fetched);
        return result;
    }

    size_t n = static_cast<size_t>(std::min<uint64_t>(fetched.data.size(), want));
    if (n == 0) {
        eof_ = true;
        return result;
    }
    std::memcpy(buffer.data(), fetched.data.data(), n);
    position_ += n;
    if (remaining_) *remaining_ -= n;
    // A short fetch means the object ended
    if (n < want) eof_ = true;

    result.bytes = n;
    return result;
}

BodyPipe::BodyPipe(size_t capacity)
    : ring_(std::max<size_t>(capacity, 2)) {}

bool BodyPipe::push(std::span<const uint8_t> data) {
    std::unique_lock<std::mutex> lock(mutex_);
    size_t done = 0;
    while (done < data.size()) {
        changed_.wait(lock, [this] {
            return cancelled_ || reader_closed_ || buffered_ < ring_.size();
        });
        if (cancelled_ || reader_closed_) return false;

        size_t tail = (head_ + buffered_) % ring_.size();
        size_t n = std::min(data.size() - done, ring_.size() - buffered_);
        n = std::min(n, ring_.size() - tail);
        std::memcpy(ring_.data() + tail, data.data() + done, n);
        buffered_ += n;
        done += n;
        peak_ = std::max(peak_, buffered_);
        changed_.notify_all();
    }
    return true;
}

void BodyPipe::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
    changed_.notify_all();
}

void BodyPipe::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    changed_.notify_all();
}

size_t BodyPipe::pull(uint8_t* dst, size_t max) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto available = [this] { return finished_ ? buffered_ : (buffered_ > 0 ? buffered_ - 1 : 0); };
    changed_.wait(lock, [&] { return cancelled_ || finished_ || available() > 0; });
    if (cancelled_) return net::ABORT_UPLOAD;

    size_t n = std::min({max, available(), ring_.size() - head_});
    std::memcpy(dst, ring_.data() + head_, n);
    head_ = (head_ + n) % ring_.size();
    buffered_ -= n;
    changed_.notify_all();
    return n;
}

void BodyPipe::close_reader() {
    std::lock_guard<std::mutex> lock(mutex_);
    reader_closed_ = true;
    changed_.notify_all();
}

size_t BodyPipe::peak_buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

StreamingWriteStream::StreamingWriteStream(uint64_t size, size_t buffer_limit, Send send)
    : pipe_(buffer_limit)
    , send_(std::move(send))
    , size_(size) {}

StreamingWriteStream::~StreamingWriteStream() {
    abort();
}

void StreamingWriteStream::start() {
    if (sender_.joinable()) return;
    sender_ = std::thread([this] {
        sent_ = send_(pipe_, size_);
        pipe_.close_reader();
    });
}

Status StreamingWriteStream::stop_sender() {
    if (sender_.joinable()) sender_.join();
    return sent_;
}

IoResult StreamingWriteStream::write(std::span<const uint8_t> data) {
    IoResult result;
    if (finished_) {
        result.fail(ErrorCode::Unknown, "write after close");
        return result;
    }
    if (written_ + data.size() > size_) {
        abort();
        result.fail(ErrorCode::PartSizeMismatch,
                    "write past declared size of " + std::to_string(size_) + " bytes");
        return result;
    }

    start();
    if (!pipe_.push(data)) {
        finished_ = true;
        auto sent = stop_sender();
        if (sent.success) {
            sent.fail(ErrorCode::Unknown, "upload ended before the body was sent");
        }
        result.fail_from(sent);
        return result;
    }
    written_ += data.size();
    result.bytes = data.size();
    return result;
}

Status StreamingWriteStream::close() {
    if (finished_) {
        return Status::failure(ErrorCode::Unknown, "stream already closed");
    }
    if (written_ != size_) {
        abort();
        return Status::failure(ErrorCode::PartSizeMismatch,
                               "wrote " + std::to_string(written_) + " of " +
                               std::to_string(size_) + " bytes");
    }
    finished_ = true;
    start();
    pipe_.finish();
    return stop_sender();
}

void StreamingWriteStream::abort() {
    finished_ = true;
    pipe_.cancel();
    if (sender_.joinable()) sender_.join();
}

// ============================================================================
// XML parsing helpers for S3 and Azure responses
// ============================================================================

namespace xml {

std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<ElementRange> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        ElementRange range;
        range.content_start = content_start;
        range.content_end = end;
        range.element_end = end + close_tag.length();
        results.push_back(range);

        pos = range.element_end;
    }

    return results;
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) {
                result += '<';
                i += 4;
            } else if (s.compare(i, 4, "&gt;") == 0) {
                result += '>';
                i += 4;
            } else if (s.compare(i, 5, "&amp;") == 0) {
                result += '&';
                i += 5;
            } else if (s.compare(i, 6, "&quot;") == 0) {
                result += '"';
                i += 6;
            } else if (s.compare(i, 6, "&apos;") == 0) {
                result += '\'';
                i += 6;
            } else {
                // Unknown entity, keep as-is
                result += s[i++];
            }
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

} // namespace xml

static uint64_t parse_size(const std::string& s) {
    if (s.empty()) return 0;
    try {
        return std::stoull(s);
    } catch (const std::exception&) {
        return 0;
    }
}

// ============================================================================
// S3 protocol helpers
// ============================================================================

std::string s3_object_url(const S3Endpoint& ep, const std::string& bucket, const std::string& key) {
    std::string url;
    if (!ep.endpoint.empty()) {
        url = ep.endpoint;
        while (!url.empty() && url.back() == '/') url.pop_back();
        if (ep.use_path_style) {
            url += "/" + bucket;
        }
    } else if (ep.use_path_style) {
        url = "https://s3." + ep.region + ".amazonaws.com/" + bucket;
    } else {
        url = "https://" + bucket + ".s3." + ep.region + ".amazonaws.com";
    }
    url += "/" + net::url_encode_path(key);
    return url;
}

ListPage parse_s3_list_page(const std::string& body, const url::ObjectLocation& where) {
    ListPage page;
    if (body.find("<Error>") != std::string::npos) {
        page.fail(ErrorCode::Unknown, "S3 list failed: " + xml::get_element(body, "Message"));
        return page;
    }

    for (const auto& range : xml::find_elements(body, "Contents")) {
        std::string content = body.substr(range.content_start,
                                          range.content_end - range.content_start);
        ListEntry entry;
        entry.url = where.to_url(xml::decode_entities(xml::get_element(content, "Key")));
        entry.size = parse_size(xml::get_element(content, "Size"));
        entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
        page.entries.push_back(std::move(entry));
    }

    if (xml::get_element(body, "IsTruncated") == "true") {
        page.next_token = xml::decode_entities(xml::get_element(body, "NextContinuationToken"));
    }
    return page;
}

std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

std::string s3_complete_multipart_body(const std::vector<std::string>& etags) {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
    for (size_t i = 0; i < etags.size(); ++i) {
        xml << "  <Part>\n";
        xml << "    <PartNumber>" << (i + 1) << "</PartNumber>\n";
        xml << "    <ETag>" << xml::escape(ensure_etag_quotes(etags[i])) << "</ETag>\n";
        xml << "  </Part>\n";
    }
    xml << "</CompleteMultipartUpload>";
    return xml.str();
}

// ============================================================================
// Azure protocol helpers
// ============================================================================

std::string azure_blob_url(const std::string& endpoint, const std::string& account,
                           const std::string& container, const std::string& blob) {
    std::string url;
    if (!endpoint.empty()) {
        url = endpoint;
        while (!url.empty() && url.back() == '/') url.pop_back();
        url += "/" + container;
    } else {
        url = "https://" + account + ".blob.core.windows.net/" + container;
    }
    if (!blob.empty()) {
        url += "/" + net::url_encode_path(blob);
    }
    return url;
}

void azure_add_common_headers(net::Request& request) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);
    char date_buf[128];
    strftime(date_buf, sizeof(date_buf), "%a, %d %b %Y %H:%M:%S GMT", &tm_buf);

    request.headers["x-ms-date"] = date_buf;
    request.headers["x-ms-version"] = constants::AZURE_API_VERSION;
}

std::string azure_string_to_sign(const net::Request& request, const std::string& verb,
                                 const std::string& resource) {
    // VERB\nContent-Encoding\nContent-Language\nContent-Length\nContent-MD5\n
    // Content-Type\nDate\nIf-Modified-Since\nIf-Match\nIf-None-Match\n
    // If-Unmodified-Since\nRange\nCanonicalizedHeaders\nCanonicalizedResource
    std::string string_to_sign;
    string_to_sign += verb + "\n";
    string_to_sign += "\n";  // Content-Encoding
    string_to_sign += "\n";  // Content-Language

    auto header = [&request](const char* name) {
        auto it = request.headers.find(name);
        return it == request.headers.end() ? std::string() : it->second;
    };

    // Zero lengths are signed as an empty line
    uint64_t length = request.content_length();
    string_to_sign += (length > 0 ? std::to_string(length) : std::string()) + "\n";

    string_to_sign += "\n";  // Content-MD5
    string_to_sign += header("content-type") + "\n";
    string_to_sign += "\n";  // Date (x-ms-date is used instead)
    string_to_sign += "\n";  // If-Modified-Since
    string_to_sign += header("if-match") + "\n";
    string_to_sign += header("if-none-match") + "\n";
    string_to_sign += "\n";  // If-Unmodified-Since
    string_to_sign += header("range") + "\n";

    // Header names are lowercase and sorted
    for (const auto& [name, value] : request.headers) {
        if (name.rfind("x-ms-", 0) == 0) {
            string_to_sign += name + ":" + value + "\n";
        }
    }

    string_to_sign += resource;

    auto qpos = request.url.find('?');
    if (qpos != std::string::npos) {
        std::string query = request.url.substr(qpos + 1);
        std::map<std::string, std::string> params;
        size_t pos = 0;
        while (pos < query.size()) {
            auto amp = query.find('&', pos);
            if (amp == std::string::npos) amp = query.size();
            std::string p = query.substr(pos, amp - pos);
            auto eq = p.find('=');
            if (eq != std::string::npos) {
                params[net::url_decode(p.substr(0, eq))] = net::url_decode(p.substr(eq + 1));
            } else {
                params[net::url_decode(p)] = "";
            }
            pos = amp + 1;
        }
        for (const auto& [name, value] : params) {
            string_to_sign += "\n" + name + ":" + value;
        }
    }

    return string_to_sign;
}

std::string azure_block_id(size_t index) {
    char id_buf[16];
    snprintf(id_buf, sizeof(id_buf), "%06zu", index);
    return net::base64_encode(std::string(id_buf));
}

std::string azure_block_list_body(size_t block_count) {
    std::ostringstream body;
    body << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    body << "<BlockList>\n";
    for (size_t i = 0; i < block_count; ++i) {
        body << "  <Latest>" << azure_block_id(i) << "</Latest>\n";
    }
    body << "</BlockList>";
    return body.str();
}

ListPage parse_azure_list_page(const std::string& body, const url::ObjectLocation& where) {
    ListPage page;

    for (const auto& range : xml::find_elements(body, "Blob")) {
        std::string content = body.substr(range.content_start,
                                          range.content_end - range.content_start);
        ListEntry entry;
        entry.url = where.to_url(xml::decode_entities(xml::get_element(content, "Name")));

        std::string props = xml::get_element(content, "Properties");
        if (!props.empty()) {
            entry.size = parse_size(xml::get_element(props, "Content-Length"));
            entry.etag = xml::decode_entities(xml::get_element(props, "Etag"));
        }
        page.entries.push_back(std::move(entry));
    }

    page.next_token = xml::decode_entities(xml::get_element(body, "NextMarker"));
    return page;
}

// ============================================================================
// GCS protocol helpers
// ============================================================================

std::string gcs_part_object_name(const std::string& object, size_t index) {
    return object + ".__part_" + std::to_string(index);
}

std::string gcs_compose_body(const std::vector<std::string>& sources) {
    nlohmann::json body;
    body["destination"] = {{"contentType", "application/octet-stream"}};
    body["sourceObjects"] = nlohmann::json::array();
    for (const auto& name : sources) {
        body["sourceObjects"].push_back({{"name", name}});
    }
    return body.dump();
}

ListPage parse_gcs_list_page(const std::string& body, const url::ObjectLocation& where) {
    ListPage page;
    try {
        auto j = nlohmann::json::parse(body);
        if (j.contains("items")) {
            for (const auto& item : j["items"]) {
                ListEntry entry;
                entry.url = where.to_url(item.value("name", ""));
                // GCS reports sizes as decimal strings
                if (item.contains("size")) {
                    const auto& size = item["size"];
                    entry.size = size.is_string() ? parse_size(size.get<std::string>())
                                                  : size.get<uint64_t>();
                }
                entry.etag = item.value("etag", "");
                page.entries.push_back(std::move(entry));
            }
        }
        page.next_token = j.value("nextPageToken", "");
    } catch (const std::exception& e) {
        page.fail(ErrorCode::Unknown, std::string("invalid GCS list response: ") + e.what());
    }
    return page;
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string result = net::base64_encode(data);
    for (auto& ch : result) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    while (!result.empty() && result.back() == '=') result.pop_back();
    return result;
}

// ============================================================================
// LocalStorageBackend - POSIX filesystem implementation
// ============================================================================

// Create a uniquely named temporary file next to `path`
static Status make_temp_sibling(const std::string& path, std::string& temp_path, int& fd) {
    std::string tmpl = path + ".bulkcp-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return errno_failure(errno, "create " + path);
    }
    ::fchmod(fd, 0644);
    temp_path.assign(buf.data());
    return Status::ok();
}

static Status ensure_parent(const std::string& path, bool create_parents) {
    if (!create_parents) return Status::ok();
    auto parent = fs::path(path).parent_path();
    if (parent.empty()) return Status::ok();

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return errno_failure(ec.value(), "create directory " + parent.string());
    }
    return Status::ok();
}

static Status write_all(int fd, const uint8_t* data, size_t size, off_t offset, bool positional) {
    size_t done = 0;
    while (done < size) {
        ssize_t n = positional
            ? ::pwrite(fd, data + done, size - done, offset + static_cast<off_t>(done))
            : ::write(fd, data + done, size - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_failure(errno, "write");
        }
        done += static_cast<size_t>(n);
    }
    return Status::ok();
}

class LocalReadStream : public ReadStream {
public:
    LocalReadStream(int fd, uint64_t offset, std::optional<uint64_t> length)
        : fd_(fd), position_(offset), remaining_(length) {}

    ~LocalReadStream() override {
        if (fd_ >= 0) ::close(fd_);
    }

    IoResult read(std::span<uint8_t> buffer) override {
        IoResult result;
        size_t want = buffer.size();
        if (remaining_) {
            want = static_cast<size_t>(std::min<uint64_t>(want, *remaining_));
        }
        if (want == 0) return result;

        ssize_t n;
        do {
            n = ::pread(fd_, buffer.data(), want, static_cast<off_t>(position_));
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            result.fail_from(errno_failure(errno, "read"));
            return result;
        }
        position_ += static_cast<uint64_t>(n);
        if (remaining_) *remaining_ -= static_cast<uint64_t>(n);
        result.bytes = static_cast<size_t>(n);
        return result;
    }

private:
    int fd_;
    uint64_t position_;
    std::optional<uint64_t> remaining_;
};

// Writes to a temporary sibling file; close() renames it onto the target
class LocalWriteStream : public WriteStream {
public:
    LocalWriteStream(std::string path, std::string temp_path, int fd)
        : path_(std::move(path)), temp_path_(std::move(temp_path)), fd_(fd) {}

    ~LocalWriteStream() override {
        if (!finished_) abort();
    }

    IoResult write(std::span<const uint8_t> data) override {
        IoResult result;
        if (finished_) {
            result.fail(ErrorCode::Unknown, "write after close");
            return result;
        }
        auto st = write_all(fd_, data.data(), data.size(), 0, false);
        if (!st.success) {
            result.fail(st.error, st.error_message + " (" + path_ + ")");
            return result;
        }
        written_ += data.size();
        result.bytes = data.size();
        return result;
    }

    Status close() override {
        if (finished_) {
            return Status::failure(ErrorCode::Unknown, "stream already closed");
        }
        finished_ = true;

        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            auto st = errno_failure(errno, "close " + path_);
            ::unlink(temp_path_.c_str());
            return st;
        }
        if (::rename(temp_path_.c_str(), path_.c_str()) != 0) {
            auto st = errno_failure(errno, "rename onto " + path_);
            ::unlink(temp_path_.c_str());
            return st;
        }
        return Status::ok();
    }

    void abort() override {
        if (finished_) return;
        finished_ = true;
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        ::unlink(temp_path_.c_str());
    }

    uint64_t bytes_written() const override { return written_; }

private:
    std::string path_;
    std::string temp_path_;
    int fd_;
    uint64_t written_ = 0;
    bool finished_ = false;
};

// One part of a local multi-part write: pwrite into a window of the shared file
class LocalPartWriteStream : public WriteStream {
public:
    using Landed = std::function<void(uint64_t)>;

    LocalPartWriteStream(int fd, uint64_t offset, uint64_t limit, Landed landed)
        : fd_(fd), offset_(offset), limit_(limit), landed_(std::move(landed)) {}

    IoResult write(std::span<const uint8_t> data) override {
        IoResult result;
        if (finished_) {
            result.fail(ErrorCode::Unknown, "write after close");
            return result;
        }
        if (written_ + data.size() > limit_) {
            result.fail(ErrorCode::PartSizeMismatch, "write beyond end of part");
            return result;
        }
        auto st = write_all(fd_, data.data(), data.size(),
                            static_cast<off_t>(offset_ + written_), true);
        if (!st.success) {
            result.fail_from(st);
            return result;
        }
        written_ += data.size();
        result.bytes = data.size();
        return result;
    }

    Status close() override {
        if (finished_) {
            return Status::failure(ErrorCode::Unknown, "stream already closed");
        }
        finished_ = true;
        landed_(written_);
        return Status::ok();
    }

    void abort() override { finished_ = true; }

    uint64_t bytes_written() const override { return written_; }

private:
    int fd_;
    uint64_t offset_;
    uint64_t limit_;
    Landed landed_;
    uint64_t written_ = 0;
    bool finished_ = false;
};

class LocalMultipartUpload : public MultipartUpload {
public:
    LocalMultipartUpload(std::string path, std::string temp_path, int fd,
                         std::vector<uint64_t> part_sizes)
        : MultipartUpload(std::move(part_sizes))
        , path_(std::move(path))
        , temp_path_(std::move(temp_path))
        , fd_(fd) {}

    ~LocalMultipartUpload() override {
        abort();
    }

    OpenWriteResult open_part(size_t index) override {
        OpenWriteResult result;
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (fd_ < 0) {
            result.fail(ErrorCode::Unknown, "upload already finished: " + path_);
            return result;
        }
        if (index >= part_count()) {
            result.fail(ErrorCode::InvalidTransfer, "no part " + std::to_string(index));
            return result;
        }
        result.stream = std::make_unique<LocalPartWriteStream>(
            fd_, part_offset(index), planned_sizes()[index],
            [this, index](uint64_t size) { record_part(index, size); });
        return result;
    }

    Status complete() override {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (fd_ < 0) {
            return Status::failure(ErrorCode::Unknown, "upload already finished: " + path_);
        }

        auto sizes = check_part_sizes();
        if (!sizes.success) {
            return sizes;
        }

        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            auto st = errno_failure(errno, "close " + path_);
            ::unlink(temp_path_.c_str());
            return st;
        }
        if (::rename(temp_path_.c_str(), path_.c_str()) != 0) {
            auto st = errno_failure(errno, "rename onto " + path_);
            ::unlink(temp_path_.c_str());
            return st;
        }
        return Status::ok();
    }

    void abort() override {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (fd_ < 0) return;
        ::close(fd_);
        fd_ = -1;
        ::unlink(temp_path_.c_str());
    }

private:
    std::string path_;
    std::string temp_path_;
    int fd_;
    std::mutex state_mutex_;
};

class LocalStorageBackend : public StorageBackend {
public:
    std::string type_name() const override { return "local"; }

    StatResult stat(const std::string& url) override {
        StatResult result;
        auto path = url::local_path(url);

        std::error_code ec;
        auto status = fs::status(path, ec);
        if (status.type() == fs::file_type::not_found) {
            result.fail(ErrorCode::NotFound, "no such file or directory: " + path);
            return result;
        }
        if (ec) {
            result.fail_from(errno_failure(ec.value(), "stat " + path));
            return result;
        }

        if (fs::is_directory(status)) {
            result.is_directory = true;
        } else {
            result.is_file = true;
            result.size = fs::file_size(path, ec);
            if (ec) {
                result.fail_from(errno_failure(ec.value(), "stat " + path));
            }
        }
        return result;
    }

    ListResult list_recursive(const std::string& url) override {
        ListResult result;
        fs::path root(url::local_path(url));

        std::error_code ec;
        fs::recursive_directory_iterator it(root, ec);
        if (ec) {
            result.fail_from(errno_failure(ec.value(), "list " + root.string()));
            return result;
        }

        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                result.fail_from(errno_failure(ec.value(), "list " + root.string()));
                return result;
            }
            std::error_code entry_ec;
            if (!it->is_regular_file(entry_ec)) continue;

            ListEntry entry;
            entry.url = url::join(url, it->path().lexically_relative(root).generic_string());
            entry.size = it->file_size(entry_ec);
            if (entry_ec) {
                result.fail_from(errno_failure(entry_ec.value(), "stat " + it->path().string()));
                return result;
            }
            result.entries.push_back(std::move(entry));
        }
        if (ec) {
            result.fail_from(errno_failure(ec.value(), "list " + root.string()));
            return result;
        }

        std::sort(result.entries.begin(), result.entries.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.url < b.url; });
        return result;
    }

    OpenReadResult open_read(const std::string& url, uint64_t offset,
                             std::optional<uint64_t> length) override {
        OpenReadResult result;
        auto path = url::local_path(url);

        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            result.fail_from(errno_failure(errno, "open " + path));
            return result;
        }

        struct stat st;
        if (::fstat(fd, &st) != 0) {
            result.fail_from(errno_failure(errno, "stat " + path));
            ::close(fd);
            return result;
        }
        if (S_ISDIR(st.st_mode)) {
            result.fail(ErrorCode::IsADirectory, "is a directory: " + path);
            ::close(fd);
            return result;
        }

        result.stream = std::make_unique<LocalReadStream>(fd, offset, length);
        return result;
    }

    OpenWriteResult open_write(const std::string& url, const WriteOptions& options) override {
        OpenWriteResult result;
        auto path = url::local_path(url);

        auto parent = ensure_parent(path, options.create_parents);
        if (!parent.success) {
            result.fail_from(parent);
            return result;
        }

        std::string temp_path;
        int fd = -1;
        auto tmp = make_temp_sibling(path, temp_path, fd);
        if (!tmp.success) {
            result.fail_from(tmp);
            return result;
        }

        result.stream = std::make_unique<LocalWriteStream>(path, temp_path, fd);
        return result;
    }

    MultipartResult create_multipart(const std::string& url,
                                     const std::vector<uint64_t>& part_sizes,
                                     const WriteOptions& options) override {
        MultipartResult result;
        auto path = url::local_path(url);

        auto parent = ensure_parent(path, options.create_parents);
        if (!parent.success) {
            result.fail_from(parent);
            return result;
        }

        std::string temp_path;
        int fd = -1;
        auto tmp = make_temp_sibling(path, temp_path, fd);
        if (!tmp.success) {
            result.fail_from(tmp);
            return result;
        }

        uint64_t total = 0;
        for (auto size : part_sizes) total += size;
        if (::ftruncate(fd, static_cast<off_t>(total)) != 0) {
            result.fail_from(errno_failure(errno, "allocate " + path));
            ::close(fd);
            ::unlink(temp_path.c_str());
            return result;
        }

        result.upload = std::make_unique<LocalMultipartUpload>(path, temp_path, fd, part_sizes);
        return result;
    }
};

// ============================================================================
// S3StorageBackend - S3-compatible storage implementation
// ============================================================================

class S3StorageBackend : public StorageBackend {
public:
    struct Config {
        S3Endpoint endpoint;
        SecureString access_key;
        SecureString secret_key;
        std::string session_token;
        bool unsigned_payload = false;  // Skip payload hashing on every request
        StorageBackendFactory::Params params;
    };

    explicit S3StorageBackend(const Config& config)
        : config_(config)
        , signer_(config.access_key.str(), config.secret_key.str(), config.endpoint.region, "s3",
                  config.session_token)
        , client_(client_options(config.params, "bulkcp-s3/1.0")) {}

    std::string type_name() const override { return "s3"; }

    StatResult stat(const std::string& url) override {
        StatResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        if (!loc->key.empty() && loc->key.back() != '/') {
            auto response = execute(net::Request::head(s3_object_url(config_.endpoint, loc->bucket, loc->key)));
            if (response.ok()) {
                result.is_file = true;
                result.size = parse_size(response.header("content-length"));
                result.etag = response.header("etag");
            } else if (response.status != 404) {
                result.fail_from(http_failure(response, "stat " + url));
                return result;
            }
        }

        auto page = list_page(*loc, directory_prefix(loc->key), "", 1);
        if (!page.success) {
            result.fail_from(page);
            return result;
        }
        result.is_directory = loc->key.empty() || !page.entries.empty();

        if (!result.is_file && !result.is_directory) {
            result.fail(ErrorCode::NotFound, "no such object or prefix: " + url);
        }
        return result;
    }

    ListResult list_recursive(const std::string& url) override {
        ListResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        std::string token;
        do {
            auto page = list_page(*loc, directory_prefix(loc->key), token, constants::LIST_PAGE_SIZE);
            if (!page.success) {
                result.fail_from(page);
                return result;
            }
            for (auto& entry : page.entries) {
                // Zero-byte directory markers
                if (!entry.url.empty() && entry.url.back() == '/') continue;
                result.entries.push_back(std::move(entry));
            }
            token = page.next_token;
        } while (!token.empty());

        std::sort(result.entries.begin(), result.entries.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.url < b.url; });
        return result;
    }

    OpenReadResult open_read(const std::string& url, uint64_t offset,
                             std::optional<uint64_t> length) override {
        OpenReadResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        auto object_url = s3_object_url(config_.endpoint, loc->bucket, loc->key);
        auto fetch = [this, object_url, url](uint64_t off, uint64_t len) {
            FetchResult fetched;
            auto request = net::Request::get(object_url);
            request.headers["range"] = net::byte_range(off, off + len - 1);
            auto response = execute(std::move(request));
            if (response.status == 416) {
                return fetched;  // past the end
            }
            if (!response.ok()) {
                fetched.fail_from(http_failure(response, "read " + url));
                return fetched;
            }
            fetched.data.assign(response.body.begin(), response.body.end());
            return fetched;
        };

        result.stream = std::make_unique<RangedReadStream>(fetch, offset, length);
        return result;
    }

    OpenWriteResult open_write(const std::string& url, const WriteOptions& options) override {
        OpenWriteResult result;
        auto loc = locate(url, result);
        if (!loc) return result;
        auto size = upload_size(options, url, result);
        if (!size) return result;

        auto object_url = s3_object_url(config_.endpoint, loc->bucket, loc->key);
        result.stream = std::make_unique<StreamingWriteStream>(
            *size, constants::UPLOAD_BUFFER_SIZE,
            [this, object_url, url](BodyPipe& body, uint64_t length) {
                auto request = net::Request::put(object_url);
                request.headers["content-type"] = "application/octet-stream";
                attach_body(request, body, length);
                auto response = execute(std::move(request));
                if (!response.ok()) {
                    return http_failure(response, "write " + url);
                }
                return Status::ok();
            });
        return result;
    }

    MultipartResult create_multipart(const std::string& url,
                                     const std::vector<uint64_t>& part_sizes,
                                     const WriteOptions&) override {
        MultipartResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        if (part_sizes.size() > constants::S3_MAX_PARTS) {
            result.fail(ErrorCode::InvalidTransfer,
                        "S3 allows at most " + std::to_string(constants::S3_MAX_PARTS) +
                        " parts, got " + std::to_string(part_sizes.size()));
            return result;
        }

        auto object_url = s3_object_url(config_.endpoint, loc->bucket, loc->key);
        auto request = net::Request::post(object_url + "?uploads");
        request.headers["content-type"] = "application/octet-stream";
        auto response = execute(std::move(request));
        if (!response.ok()) {
            result.fail_from(http_failure(response, "initiate multipart upload " + url));
            return result;
        }

        std::string upload_id = xml::get_element(response.body, "UploadId");
        if (upload_id.empty()) {
            result.fail(ErrorCode::Unknown, "no UploadId in response for " + url);
            return result;
        }

        log_info("started multipart upload of %s in %zu parts", url.c_str(), part_sizes.size());
        result.upload = std::make_unique<Upload>(this, object_url, url, upload_id, part_sizes);
        return result;
    }

private:
    class Upload : public MultipartUpload {
    public:
        Upload(S3StorageBackend* backend, std::string object_url, std::string url,
               std::string upload_id, std::vector<uint64_t> part_sizes)
            : MultipartUpload(std::move(part_sizes))
            , backend_(backend)
            , object_url_(std::move(object_url))
            , url_(std::move(url))
            , upload_id_(std::move(upload_id))
            , etags_(part_count()) {}

        ~Upload() override {
            abort();
        }

        OpenWriteResult open_part(size_t index) override {
            OpenWriteResult result;
            if (index >= part_count()) {
                result.fail(ErrorCode::InvalidTransfer, "no part " + std::to_string(index));
                return result;
            }
            result.stream = std::make_unique<StreamingWriteStream>(
                planned_sizes()[index], constants::UPLOAD_BUFFER_SIZE,
                [this, index](BodyPipe& body, uint64_t size) {
                    std::string part_url = object_url_ +
                        "?partNumber=" + std::to_string(index + 1) +
                        "&uploadId=" + net::url_encode(upload_id_);
                    auto request = net::Request::put(part_url);
                    attach_body(request, body, size);
                    auto response = backend_->execute(std::move(request));
                    if (!response.ok()) {
                        return http_failure(response, "upload part " + std::to_string(index + 1) +
                                                      " of " + url_);
                    }
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        etags_[index] = ensure_etag_quotes(response.header("etag"));
                    }
                    record_part(index, size);
                    return Status::ok();
                });
            return result;
        }

        Status complete() override {
            auto sizes = check_part_sizes();
            if (!sizes.success) return sizes;

            std::vector<std::string> etags;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (finished_) {
                    return Status::failure(ErrorCode::Unknown, "upload already finished: " + url_);
                }
                etags = etags_;
            }

            auto request = net::Request::post(
                object_url_ + "?uploadId=" + net::url_encode(upload_id_),
                s3_complete_multipart_body(etags));
            request.headers["content-type"] = "application/xml";
            auto response = backend_->execute(std::move(request));
            if (!response.ok()) {
                return http_failure(response, "complete multipart upload " + url_);
            }
            // CompleteMultipartUpload can fail with a 200 status and an error body
            const std::string& body = response.body;
            if (body.find("<Error>") != std::string::npos) {
                return Status::failure(ErrorCode::Unknown,
                                       "complete multipart upload " + url_ + ": " +
                                       xml::get_element(body, "Message"));
            }

            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
            return Status::ok();
        }

        void abort() override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (finished_) return;
                finished_ = true;
            }
            auto response = backend_->execute(
                net::Request::del(object_url_ + "?uploadId=" + net::url_encode(upload_id_)));
            if (!response.ok()) {
                log_warn("failed to abort multipart upload of %s: %s",
                         url_.c_str(), response.describe().c_str());
            }
        }

    private:
        S3StorageBackend* backend_;
        std::string object_url_;
        std::string url_;
        std::string upload_id_;
        std::mutex mutex_;
        std::vector<std::string> etags_;
        bool finished_ = false;
    };

    std::optional<url::ObjectLocation> locate(const std::string& u, Status& status) const {
        auto loc = url::parse_object_location(u);
        if (!loc || loc->scheme != "s3") {
            status.fail(ErrorCode::InvalidTransfer, "not an S3 URL: " + u);
            return std::nullopt;
        }
        return loc;
    }

    static std::string directory_prefix(const std::string& key) {
        if (key.empty() || key.back() == '/') return key;
        return key + "/";
    }

    ListPage list_page(const url::ObjectLocation& loc, const std::string& prefix,
                       const std::string& token, int max_keys) {
        std::string list_url = s3_object_url(config_.endpoint, loc.bucket, "");
        list_url += "?list-type=2";
        if (!prefix.empty()) {
            list_url += "&prefix=" + net::url_encode(prefix);
        }
        list_url += "&max-keys=" + std::to_string(max_keys);
        if (!token.empty()) {
            list_url += "&continuation-token=" + net::url_encode(token);
        }

        auto response = execute(net::Request::get(list_url));
        if (!response.ok()) {
            ListPage page;
            page.fail_from(http_failure(response, "list s3://" + loc.bucket + "/" + prefix));
            return page;
        }
        return parse_s3_list_page(response.body, loc);
    }

    // Sign (when credentials are configured) and send with retry. Streamed
    // bodies are always sent as UNSIGNED-PAYLOAD.
    net::Response execute(net::Request request) {
        if (config_.unsigned_payload || request.body_source) {
            request.headers["x-amz-content-sha256"] = "UNSIGNED-PAYLOAD";
        }
        if (!config_.access_key.empty()) {
            signer_.sign(request);
        }
        return client_.send_with_retry(request);
    }

    Config config_;
    net::SigV4Signer signer_;
    net::Client client_;
};

// ============================================================================
// AzureStorageBackend - Azure Blob Storage implementation
// ============================================================================

class AzureStorageBackend : public StorageBackend {
public:
    struct Config {
        SecureString account_key;  // SharedKey auth
        std::string sas_token;     // Alternative: SAS token auth
        std::string endpoint;      // Empty for Azure, custom for the Azurite emulator
        StorageBackendFactory::Params params;
    };

    explicit AzureStorageBackend(const Config& config)
        : config_(config)
        , client_(client_options(config.params, "bulkcp-azure/1.0")) {}

    std::string type_name() const override { return "azure"; }

    StatResult stat(const std::string& url) override {
        StatResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        if (!loc->key.empty() && loc->key.back() != '/') {
            auto response = execute(net::Request::head(blob_url(*loc, loc->key)), *loc, loc->key);
            if (response.ok()) {
                result.is_file = true;
                result.size = parse_size(response.header("content-length"));
                result.etag = response.header("etag");
            } else if (response.status != 404) {
                result.fail_from(http_failure(response, "stat " + url));
                return result;
            }
        }

        auto page = list_page(*loc, directory_prefix(loc->key), "", 1);
        if (!page.success) {
            result.fail_from(page);
            return result;
        }
        result.is_directory = loc->key.empty() || !page.entries.empty();

        if (!result.is_file && !result.is_directory) {
            result.fail(ErrorCode::NotFound, "no such blob or prefix: " + url);
        }
        return result;
    }

    ListResult list_recursive(const std::string& url) override {
        ListResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        std::string marker;
        do {
            auto page = list_page(*loc, directory_prefix(loc->key), marker, constants::LIST_PAGE_SIZE);
            if (!page.success) {
                result.fail_from(page);
                return result;
            }
            for (auto& entry : page.entries) {
                if (!entry.url.empty() && entry.url.back() == '/') continue;
                result.entries.push_back(std::move(entry));
            }
            marker = page.next_token;
        } while (!marker.empty());

        std::sort(result.entries.begin(), result.entries.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.url < b.url; });
        return result;
    }

    OpenReadResult open_read(const std::string& url, uint64_t offset,
                             std::optional<uint64_t> length) override {
        OpenReadResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        auto fetch = [this, loc = *loc, url](uint64_t off, uint64_t len) {
            FetchResult fetched;
            auto request = net::Request::get(blob_url(loc, loc.key));
            request.headers["x-ms-range"] = net::byte_range(off, off + len - 1);
            auto response = execute(std::move(request), loc, loc.key);
            if (response.status == 416) {
                return fetched;
            }
            if (!response.ok()) {
                fetched.fail_from(http_failure(response, "read " + url));
                return fetched;
            }
            fetched.data.assign(response.body.begin(), response.body.end());
            return fetched;
        };

        result.stream = std::make_unique<RangedReadStream>(fetch, offset, length);
        return result;
    }

    OpenWriteResult open_write(const std::string& url, const WriteOptions& options) override {
        OpenWriteResult result;
        auto loc = locate(url, result);
        if (!loc) return result;
        auto size = upload_size(options, url, result);
        if (!size) return result;

        result.stream = std::make_unique<StreamingWriteStream>(
            *size, constants::UPLOAD_BUFFER_SIZE,
            [this, loc = *loc, url](BodyPipe& body, uint64_t length) {
                auto request = net::Request::put(blob_url(loc, loc.key));
                request.headers["x-ms-blob-type"] = "BlockBlob";
                request.headers["content-type"] = "application/octet-stream";
                attach_body(request, body, length);
                auto response = execute(std::move(request), loc, loc.key);
                if (!response.ok()) {
                    return http_failure(response, "write " + url);
                }
                return Status::ok();
            });
        return result;
    }

    MultipartResult create_multipart(const std::string& url,
                                     const std::vector<uint64_t>& part_sizes,
                                     const WriteOptions&) override {
        MultipartResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        if (part_sizes.size() > constants::AZURE_MAX_BLOCKS) {
            result.fail(ErrorCode::InvalidTransfer,
                        "Azure allows at most " + std::to_string(constants::AZURE_MAX_BLOCKS) +
                        " blocks, got " + std::to_string(part_sizes.size()));
            return result;
        }

        // Blocks are staged directly against the blob; nothing to initiate
        result.upload = std::make_unique<Upload>(this, *loc, url, part_sizes);
        return result;
    }

private:
    class Upload : public MultipartUpload {
    public:
        Upload(AzureStorageBackend* backend, url::ObjectLocation loc, std::string url,
               std::vector<uint64_t> part_sizes)
            : MultipartUpload(std::move(part_sizes))
            , backend_(backend)
            , loc_(std::move(loc))
            , url_(std::move(url)) {}

        OpenWriteResult open_part(size_t index) override {
            OpenWriteResult result;
            if (index >= part_count()) {
                result.fail(ErrorCode::InvalidTransfer, "no part " + std::to_string(index));
                return result;
            }
            result.stream = std::make_unique<StreamingWriteStream>(
                planned_sizes()[index], constants::UPLOAD_BUFFER_SIZE,
                [this, index](BodyPipe& body, uint64_t size) {
                    auto block_url = backend_->blob_url(loc_, loc_.key) +
                        "?comp=block&blockid=" + net::url_encode(azure_block_id(index));
                    auto request = net::Request::put(block_url);
                    attach_body(request, body, size);
                    auto response = backend_->execute(std::move(request), loc_, loc_.key);
                    if (!response.ok()) {
                        return http_failure(response, "put block " + std::to_string(index) +
                                                      " of " + url_);
                    }
                    record_part(index, size);
                    return Status::ok();
                });
            return result;
        }

        Status complete() override {
            auto sizes = check_part_sizes();
            if (!sizes.success) return sizes;

            auto request = net::Request::put(backend_->blob_url(loc_, loc_.key) + "?comp=blocklist",
                                             azure_block_list_body(part_count()));
            request.headers["content-type"] = "application/xml";
            request.headers["x-ms-blob-content-type"] = "application/octet-stream";
            auto response = backend_->execute(std::move(request), loc_, loc_.key);
            if (!response.ok()) {
                return http_failure(response, "commit block list " + url_);
            }
            return Status::ok();
        }

        // Uncommitted blocks are garbage collected by the service
        void abort() override {}

    private:
        AzureStorageBackend* backend_;
        url::ObjectLocation loc_;
        std::string url_;
    };

    std::optional<url::ObjectLocation> locate(const std::string& u, Status& status) const {
        auto loc = url::parse_object_location(u);
        if (!loc || (loc->scheme != "hail-az" && loc->scheme != "https")) {
            status.fail(ErrorCode::InvalidTransfer, "not an Azure Blob URL: " + u);
            return std::nullopt;
        }
        return loc;
    }

    static std::string directory_prefix(const std::string& key) {
        if (key.empty() || key.back() == '/') return key;
        return key + "/";
    }

    std::string blob_url(const url::ObjectLocation& loc, const std::string& blob) const {
        return azure_blob_url(config_.endpoint, loc.account, loc.bucket, blob);
    }

    ListPage list_page(const url::ObjectLocation& loc, const std::string& prefix,
                       const std::string& marker, int max_results) {
        std::string list_url = blob_url(loc, "") + "?restype=container&comp=list";
        if (!prefix.empty()) {
            list_url += "&prefix=" + net::url_encode(prefix);
        }
        list_url += "&maxresults=" + std::to_string(max_results);
        if (!marker.empty()) {
            list_url += "&marker=" + net::url_encode(marker);
        }

        auto response = execute(net::Request::get(list_url), loc, "");
        if (!response.ok()) {
            ListPage page;
            page.fail_from(http_failure(response, "list container " + loc.bucket));
            return page;
        }
        return parse_azure_list_page(response.body, loc);
    }

    // Add auth (SAS or SharedKey) and send with retry
    net::Response execute(net::Request request, const url::ObjectLocation& loc,
                          const std::string& blob) {
        azure_add_common_headers(request);

        if (!config_.sas_token.empty()) {
            std::string token = config_.sas_token;
            if (!token.empty() && token.front() == '?') token.erase(0, 1);
            request.url += (request.url.find('?') != std::string::npos ? "&" : "?") + token;
        } else if (!config_.account_key.empty()) {
            std::string resource = "/" + loc.account + "/" + loc.bucket;
            if (!blob.empty()) resource += "/" + blob;

            auto string_to_sign = azure_string_to_sign(request, net::method_name(request.method),
                                                       resource);
            auto decoded_key = net::base64_decode(config_.account_key.str());
            auto signature = net::hmac_sha256(decoded_key, string_to_sign);
            request.headers["authorization"] =
                "SharedKey " + loc.account + ":" + net::base64_encode(signature);
        }

        return client_.send_with_retry(request);
    }

    Config config_;
    net::Client client_;
};

// ============================================================================
// GCSStorageBackend - Google Cloud Storage implementation
// ============================================================================

class GCSStorageBackend : public StorageBackend {
public:
    struct Config {
        std::string project;           // billed for requester-pays buckets
        std::string credentials_json;  // Service account JSON content
        std::string credentials_file;  // Or path to JSON key file
        std::string endpoint;          // Empty for Google, custom for emulator
        StorageBackendFactory::Params params;
    };

    explicit GCSStorageBackend(const Config& config)
        : config_(config)
        , client_(client_options(config.params, "bulkcp-gcs/1.0")) {
        if (config_.credentials_json.empty() && !config_.credentials_file.empty()) {
            std::ifstream cred_file(config_.credentials_file);
            if (!cred_file) {
                throw std::runtime_error("cannot read GCS credentials file: " + config_.credentials_file);
            }
            std::ostringstream ss;
            ss << cred_file.rdbuf();
            config_.credentials_json = ss.str();
        }
    }

    std::string type_name() const override { return "gcs"; }

    StatResult stat(const std::string& url) override {
        StatResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        if (!loc->key.empty() && loc->key.back() != '/') {
            auto response = execute(net::Request::get(metadata_url(loc->bucket, loc->key)));
            if (response.ok()) {
                try {
                    auto j = nlohmann::json::parse(response.body);
                    result.is_file = true;
                    result.size = parse_size(j.value("size", "0"));
                    result.etag = j.value("etag", "");
                } catch (const std::exception& e) {
                    result.fail(ErrorCode::Unknown, "invalid GCS metadata for " + url + ": " + e.what());
                    return result;
                }
            } else if (response.status != 404) {
                result.fail_from(http_failure(response, "stat " + url));
                return result;
            }
        }

        auto page = list_page(*loc, directory_prefix(loc->key), "", 1);
        if (!page.success) {
            result.fail_from(page);
            return result;
        }
        result.is_directory = loc->key.empty() || !page.entries.empty();

        if (!result.is_file && !result.is_directory) {
            result.fail(ErrorCode::NotFound, "no such object or prefix: " + url);
        }
        return result;
    }

    ListResult list_recursive(const std::string& url) override {
        ListResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        std::string token;
        do {
            auto page = list_page(*loc, directory_prefix(loc->key), token, constants::LIST_PAGE_SIZE);
            if (!page.success) {
                result.fail_from(page);
                return result;
            }
            for (auto& entry : page.entries) {
                if (!entry.url.empty() && entry.url.back() == '/') continue;
                result.entries.push_back(std::move(entry));
            }
            token = page.next_token;
        } while (!token.empty());

        std::sort(result.entries.begin(), result.entries.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.url < b.url; });
        return result;
    }

    OpenReadResult open_read(const std::string& url, uint64_t offset,
                             std::optional<uint64_t> length) override {
        OpenReadResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        auto media_url = metadata_url(loc->bucket, loc->key) + "?alt=media";
        auto fetch = [this, media_url, url](uint64_t off, uint64_t len) {
            FetchResult fetched;
            auto request = net::Request::get(media_url);
            request.headers["range"] = net::byte_range(off, off + len - 1);
            auto response = execute(std::move(request));
            if (response.status == 416) {
                return fetched;
            }
            if (!response.ok()) {
                fetched.fail_from(http_failure(response, "read " + url));
                return fetched;
            }
            fetched.data.assign(response.body.begin(), response.body.end());
            return fetched;
        };

        result.stream = std::make_unique<RangedReadStream>(fetch, offset, length);
        return result;
    }

    OpenWriteResult open_write(const std::string& url, const WriteOptions& options) override {
        OpenWriteResult result;
        auto loc = locate(url, result);
        if (!loc) return result;
        auto size = upload_size(options, url, result);
        if (!size) return result;

        result.stream = std::make_unique<StreamingWriteStream>(
            *size, constants::UPLOAD_BUFFER_SIZE,
            [this, loc = *loc, url](BodyPipe& body, uint64_t length) {
                return upload_object(loc.bucket, loc.key, body, length, "write " + url);
            });
        return result;
    }

    MultipartResult create_multipart(const std::string& url,
                                     const std::vector<uint64_t>& part_sizes,
                                     const WriteOptions&) override {
        MultipartResult result;
        auto loc = locate(url, result);
        if (!loc) return result;

        result.upload = std::make_unique<Upload>(this, *loc, url, part_sizes);
        return result;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(token_mutex_);
        cached_token_.clear();
    }

private:
    // Parts land as temporary objects and are composed into the destination
    class Upload : public MultipartUpload {
    public:
        Upload(GCSStorageBackend* backend, url::ObjectLocation loc, std::string url,
               std::vector<uint64_t> part_sizes)
            : MultipartUpload(std::move(part_sizes))
            , backend_(backend)
            , loc_(std::move(loc))
            , url_(std::move(url))
            , landed_(part_count(), false) {}

        ~Upload() override {
            abort();
        }

        OpenWriteResult open_part(size_t index) override {
            OpenWriteResult result;
            if (index >= part_count()) {
                result.fail(ErrorCode::InvalidTransfer, "no part " + std::to_string(index));
                return result;
            }
            result.stream = std::make_unique<StreamingWriteStream>(
                planned_sizes()[index], constants::UPLOAD_BUFFER_SIZE,
                [this, index](BodyPipe& body, uint64_t size) {
                    auto st = backend_->upload_object(
                        loc_.bucket, gcs_part_object_name(loc_.key, index), body, size,
                        "upload part " + std::to_string(index) + " of " + url_);
                    if (!st.success) return st;
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        landed_[index] = true;
                    }
                    record_part(index, size);
                    return Status::ok();
                });
            return result;
        }

        Status complete() override {
            auto sizes = check_part_sizes();
            if (!sizes.success) return sizes;

            std::vector<std::string> sources;
            for (size_t i = 0; i < part_count(); ++i) {
                sources.push_back(gcs_part_object_name(loc_.key, i));
            }

            // Compose accepts a limited number of sources per call, so cascade
            // through intermediate objects
            std::vector<std::string> intermediates;
            size_t level = 0;
            Status status;
            while (status.success && sources.size() > constants::GCS_MAX_COMPOSE_SOURCES) {
                std::vector<std::string> next;
                for (size_t i = 0; i < sources.size(); i += constants::GCS_MAX_COMPOSE_SOURCES) {
                    size_t end = std::min(i + constants::GCS_MAX_COMPOSE_SOURCES, sources.size());
                    std::vector<std::string> batch(sources.begin() + i, sources.begin() + end);
                    std::string dest = loc_.key + ".__comp_" + std::to_string(level) + "_" +
                                       std::to_string(next.size());
                    status = backend_->compose(loc_.bucket, dest, batch);
                    if (!status.success) break;
                    intermediates.push_back(dest);
                    next.push_back(dest);
                }
                sources = std::move(next);
                ++level;
            }
            if (status.success) {
                status = backend_->compose(loc_.bucket, loc_.key, sources);
            }

            for (const auto& name : intermediates) {
                backend_->delete_object(loc_.bucket, name);
            }
            delete_parts();
            return status;
        }

        void abort() override {
            delete_parts();
        }

    private:
        void delete_parts() {
            std::vector<size_t> landed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (size_t i = 0; i < landed_.size(); ++i) {
                    if (landed_[i]) {
                        landed.push_back(i);
                        landed_[i] = false;
                    }
                }
            }
            for (size_t i : landed) {
                backend_->delete_object(loc_.bucket, gcs_part_object_name(loc_.key, i));
            }
        }

        GCSStorageBackend* backend_;
        url::ObjectLocation loc_;
        std::string url_;
        std::mutex mutex_;
        std::vector<bool> landed_;
    };

    std::optional<url::ObjectLocation> locate(const std::string& u, Status& status) const {
        auto loc = url::parse_object_location(u);
        if (!loc || loc->scheme != "gs") {
            status.fail(ErrorCode::InvalidTransfer, "not a GCS URL: " + u);
            return std::nullopt;
        }
        return loc;
    }

    static std::string directory_prefix(const std::string& key) {
        if (key.empty() || key.back() == '/') return key;
        return key + "/";
    }

    std::string api_base() const {
        if (!config_.endpoint.empty()) {
            return config_.endpoint + "/storage/v1";
        }
        return "https://storage.googleapis.com/storage/v1";
    }

    std::string upload_base() const {
        if (!config_.endpoint.empty()) {
            return config_.endpoint + "/upload/storage/v1";
        }
        return "https://storage.googleapis.com/upload/storage/v1";
    }

    std::string metadata_url(const std::string& bucket, const std::string& object) const {
        return api_base() + "/b/" + bucket + "/o/" + net::url_encode(object);
    }

    ListPage list_page(const url::ObjectLocation& loc, const std::string& prefix,
                       const std::string& token, int max_results) {
        std::string list_url = api_base() + "/b/" + loc.bucket + "/o?maxResults=" +
                               std::to_string(max_results);
        if (!prefix.empty()) {
            list_url += "&prefix=" + net::url_encode(prefix);
        }
        if (!token.empty()) {
            list_url += "&pageToken=" + net::url_encode(token);
        }

        auto response = execute(net::Request::get(list_url));
        if (!response.ok()) {
            ListPage page;
            page.fail_from(http_failure(response, "list gs://" + loc.bucket + "/" + prefix));
            return page;
        }
        return parse_gcs_list_page(response.body, loc);
    }

    Status upload_object(const std::string& bucket, const std::string& object,
                         BodyPipe& body, uint64_t size, const std::string& what) {
        auto upload_url = upload_base() + "/b/" + bucket + "/o?uploadType=media&name=" +
                          net::url_encode(object);
        auto request = net::Request::post(upload_url);
        request.headers["content-type"] = "application/octet-stream";
        attach_body(request, body, size);
        auto response = execute(std::move(request));
        if (!response.ok()) {
            return http_failure(response, what);
        }
        return Status::ok();
    }

    Status compose(const std::string& bucket, const std::string& destination,
                   const std::vector<std::string>& sources) {
        auto compose_url = metadata_url(bucket, destination) + "/compose";
        auto request = net::Request::post(compose_url, gcs_compose_body(sources));
        request.headers["content-type"] = "application/json";
        auto response = execute(std::move(request));
        if (!response.ok()) {
            return http_failure(response, "compose gs://" + bucket + "/" + destination);
        }
        return Status::ok();
    }

    // Best-effort cleanup of temporary objects
    void delete_object(const std::string& bucket, const std::string& object) {
        auto response = execute(net::Request::del(metadata_url(bucket, object)));
        if (!response.ok() && response.status != 404) {
            log_warn("failed to delete temporary object gs://%s/%s: %s",
                     bucket.c_str(), object.c_str(), response.describe().c_str());
        }
    }

    net::Response execute(net::Request request) {
        if (!config_.project.empty()) {
            request.url += (request.url.find('?') != std::string::npos ? "&" : "?");
            request.url += "userProject=" + net::url_encode(config_.project);
        }

        auto token = access_token();
        if (!token) {
            net::Response response;
            response.status = 401;
            response.transport_error = "failed to obtain GCS access token";
            return response;
        }
        if (!token->empty()) {
            request.headers["authorization"] = "Bearer " + *token;
        }
        return client_.send_with_retry(request);
    }

    // OAuth2 bearer token from the service account key. Empty when no
    // credentials are configured (anonymous access), nullopt on failure.
    std::optional<std::string> access_token() {
        std::lock_guard<std::mutex> lock(token_mutex_);

        auto now = std::chrono::steady_clock::now();
        if (!cached_token_.empty() && now < token_expiry_) {
            return cached_token_;
        }
        if (config_.credentials_json.empty()) {
            return std::string();
        }

        std::string client_email, private_key, token_uri;
        try {
            auto creds = nlohmann::json::parse(config_.credentials_json);
            client_email = creds.value("client_email", "");
            private_key = creds.value("private_key", "");
            token_uri = creds.value("token_uri", constants::GCS_TOKEN_URI);
        } catch (const std::exception& e) {
            log_error("invalid GCS service account key: %s", e.what());
            return std::nullopt;
        }
        if (client_email.empty() || private_key.empty()) {
            log_error("GCS service account key lacks client_email or private_key");
            return std::nullopt;
        }

        auto iat = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        nlohmann::json header = {{"alg", "RS256"}, {"typ", "JWT"}};
        nlohmann::json payload = {
            {"iss", client_email},
            {"scope", "https://www.googleapis.com/auth/devstorage.read_write"},
            {"aud", token_uri},
            {"iat", iat},
            {"exp", iat + 3600},
        };

        auto encode = [](const std::string& s) {
            return base64url_encode(std::vector<uint8_t>(s.begin(), s.end()));
        };
        std::string signing_input = encode(header.dump()) + "." + encode(payload.dump());

        std::string signature = rsa_sign_sha256(private_key, signing_input);
        if (signature.empty()) {
            log_error("failed to sign GCS token request");
            return std::nullopt;
        }
        std::string jwt = signing_input + "." + encode(signature);

        std::string post_body =
            "grant_type=urn%3Aietf%3Aparams%3Aoauth%3Agrant-type%3Ajwt-bearer&assertion=" + jwt;
        auto token_request = net::Request::post(token_uri, post_body);
        token_request.headers["content-type"] = "application/x-www-form-urlencoded";

        auto response = client_.send_with_retry(token_request);
        if (!response.ok()) {
            log_error("GCS token exchange failed: %s", response.describe().c_str());
            return std::nullopt;
        }

        try {
            auto j = nlohmann::json::parse(response.body);
            cached_token_ = j.value("access_token", "");
        } catch (const std::exception& e) {
            log_error("invalid GCS token response: %s", e.what());
            return std::nullopt;
        }
        if (cached_token_.empty()) {
            return std::nullopt;
        }
        token_expiry_ = std::chrono::steady_clock::now() + std::chrono::minutes(55);
        return cached_token_;
    }

    static std::string rsa_sign_sha256(const std::string& pem_key, const std::string& data) {
        BIO* bio = BIO_new_mem_buf(pem_key.data(), static_cast<int>(pem_key.size()));
        if (!bio) return "";

        EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
        BIO_free(bio);
        if (!pkey) return "";

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            EVP_PKEY_free(pkey);
            return "";
        }

        std::string signature;
        if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, pkey) == 1 &&
            EVP_DigestSignUpdate(ctx, data.data(), data.size()) == 1) {
            size_t sig_len = 0;
            if (EVP_DigestSignFinal(ctx, nullptr, &sig_len) == 1) {
                signature.resize(sig_len);
                if (EVP_DigestSignFinal(ctx, reinterpret_cast<unsigned char*>(signature.data()),
                                        &sig_len) == 1) {
                    signature.resize(sig_len);
                } else {
                    signature.clear();
                }
            }
        }

        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        return signature;
    }

    Config config_;
    net::Client client_;

    std::mutex token_mutex_;
    std::string cached_token_;
    std::chrono::steady_clock::time_point token_expiry_;
};

// ============================================================================
// StorageBackendFactory
// ============================================================================

std::unique_ptr<StorageBackend> StorageBackendFactory::create(const std::string& type,
                                                              const Params& params) {
    if (type == "local") return create_local();
    if (type == "s3") return create_s3(params);
    if (type == "azure") return create_azure(params);
    if (type == "gcs") return create_gcs(params);
    throw std::runtime_error("Unknown storage backend type: " + type);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_local() {
    return std::make_unique<LocalStorageBackend>();
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_s3(const Params& params) {
    S3StorageBackend::Config config;
    config.endpoint.region = param(params, "region", constants::DEFAULT_S3_REGION);
    config.endpoint.endpoint = param(params, "endpoint");
    config.endpoint.use_path_style = parse_bool(param(params, "use_path_style", "false"));
    config.access_key = SecureString(param(params, "access_key"));
    config.secret_key = SecureString(param(params, "secret_key"));
    config.session_token = param(params, "session_token");
    config.unsigned_payload = parse_bool(param(params, "unsigned_payload", "false"));
    config.params = params;

    if (config.access_key.empty() != config.secret_key.empty()) {
        throw std::runtime_error("S3 backend requires both access_key and secret_key");
    }
    return std::make_unique<S3StorageBackend>(config);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_azure(const Params& params) {
    AzureStorageBackend::Config config;
    config.account_key = SecureString(param(params, "account_key"));
    config.sas_token = param(params, "sas_token");
    config.endpoint = param(params, "endpoint");
    config.params = params;
    return std::make_unique<AzureStorageBackend>(config);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_gcs(const Params& params) {
    GCSStorageBackend::Config config;
    config.project = param(params, "project");
    config.credentials_json = param(params, "credentials_json");
    config.credentials_file = param(params, "credentials_file");
    config.endpoint = param(params, "endpoint");
    config.params = params;
    return std::make_unique<GCSStorageBackend>(config);
}

} // namespace bulkcp
