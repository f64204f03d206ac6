#include "bulkcp/net/http.hpp"
#include "bulkcp/core/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <thread>

namespace bulkcp::net {

// ============================================================================
// Encoding and digests
// ============================================================================

const char* method_name(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Head: return "HEAD";
        case Method::Put: return "PUT";
        case Method::Post: return "POST";
        case Method::Delete: return "DELETE";
    }
    return "GET";
}

bool retryable_status(int status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

static const char* HEX_DIGITS = "0123456789ABCDEF";

std::string url_encode(const std::string& str) {
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX_DIGITS[c >> 4];
            out += HEX_DIGITS[c & 0x0f];
        }
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += str[i] == '+' ? ' ' : str[i];
    }
    return out;
}

std::string url_encode_path(const std::string& path) {
    std::string out;
    size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) {
            out += url_encode(path.substr(start));
            return out;
        }
        out += url_encode(path.substr(start, slash - start));
        out += '/';
        start = slash + 1;
    }
}

std::string base64_encode(const std::string& data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(std::string(data.begin(), data.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::string in;
    in.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) in += c;
    }
    if (in.empty() || in.size() % 4 != 0) return {};

    std::vector<uint8_t> out(in.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    if (n < 0) return {};

    // EVP_DecodeBlock counts the padding as zero bytes
    size_t padding = 0;
    if (in[in.size() - 1] == '=') ++padding;
    if (in[in.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

static std::string to_hex(const unsigned char* data, size_t len) {
    static const char* lower = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += lower[data[i] >> 4];
        out += lower[data[i] & 0x0f];
    }
    return out;
}

std::string sha256_hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    return to_hex(md, md_len);
}

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), md, &md_len);
    return std::vector<uint8_t>(md, md + md_len);
}

std::string byte_range(uint64_t first, uint64_t last) {
    return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Splits "scheme://host[:port]/path?query" into its signing components
static void split_url(const std::string& url, std::string& host, std::string& path,
                      std::string& query) {
    size_t pos = url.find("://");
    pos = pos == std::string::npos ? 0 : pos + 3;
    size_t host_end = url.find_first_of("/?", pos);
    host = url.substr(pos, host_end == std::string::npos ? std::string::npos : host_end - pos);
    path = "/";
    query.clear();
    if (host_end == std::string::npos) return;

    size_t q = url.find('?', host_end);
    if (url[host_end] == '/') {
        path = url.substr(host_end, q == std::string::npos ? std::string::npos : q - host_end);
    }
    if (q != std::string::npos) query = url.substr(q + 1);
}

// ============================================================================
// Request / Response
// ============================================================================

Request Request::get(const std::string& url) {
    Request r;
    r.method = Method::Get;
    r.url = url;
    return r;
}

Request Request::head(const std::string& url) {
    Request r;
    r.method = Method::Head;
    r.url = url;
    return r;
}

Request Request::put(const std::string& url, std::string body) {
    Request r;
    r.method = Method::Put;
    r.url = url;
    r.body = std::move(body);
    return r;
}

Request Request::post(const std::string& url, std::string body) {
    Request r;
    r.method = Method::Post;
    r.url = url;
    r.body = std::move(body);
    return r;
}

Request Request::del(const std::string& url) {
    Request r;
    r.method = Method::Delete;
    r.url = url;
    return r;
}

std::string Response::header(const std::string& name) const {
    auto it = headers.find(lowercase(name));
    return it == headers.end() ? std::string() : it->second;
}

std::string Response::describe() const {
    if (!transport_error.empty()) return transport_error;
    return "HTTP " + std::to_string(status);
}

// ============================================================================
// Client
// ============================================================================

namespace {

struct ReceiveContext {
    std::string* body;
    size_t limit;
    bool overflow = false;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ReceiveContext*>(userdata);
    size_t bytes = size * nmemb;
    if (ctx->body->size() + bytes > ctx->limit) {
        ctx->overflow = true;
        return 0;
    }
    ctx->body->append(ptr, bytes);
    return bytes;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<Headers*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    // A new status line starts a fresh header block (100-continue, redirects)
    if (line.starts_with("HTTP/")) {
        headers->clear();
        return bytes;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        auto value_start = line.find_first_not_of(" \t", colon + 1);
        (*headers)[lowercase(line.substr(0, colon))] =
            value_start == std::string::npos ? std::string() : line.substr(value_start);
    }
    return bytes;
}

struct SendContext {
    const Request* request;
    size_t offset = 0;
};

size_t on_upload(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<SendContext*>(userdata);
    size_t max = size * nitems;

    if (ctx->request->body_source) {
        size_t n = ctx->request->body_source(reinterpret_cast<uint8_t*>(buffer), max);
        return n == ABORT_UPLOAD ? CURL_READFUNC_ABORT : n;
    }

    const std::string& body = ctx->request->body;
    size_t n = std::min(max, body.size() - ctx->offset);
    std::memcpy(buffer, body.data() + ctx->offset, n);
    ctx->offset += n;
    return n;
}

} // namespace

struct Client::Pool {
    static constexpr size_t MAX_IDLE = 64;

    std::mutex mutex;
    std::vector<CURL*> idle;

    ~Pool() {
        for (CURL* handle : idle) curl_easy_cleanup(handle);
    }

    CURL* acquire() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!idle.empty()) {
                CURL* handle = idle.back();
                idle.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(mutex);
        if (idle.size() < MAX_IDLE) {
            idle.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }
};

Client::Client(ClientOptions options)
    : options_(std::move(options))
    , pool_(std::make_unique<Pool>()) {
    static std::once_flag curl_init;
    std::call_once(curl_init, []() { curl_global_init(CURL_GLOBAL_ALL); });

    if (!options_.verify_ssl) {
        log_warn("TLS certificate verification is disabled for %s", options_.user_agent.c_str());
    }
}

Client::~Client() = default;

Response Client::send(const Request& request) {
    Response response;

    CURL* curl = pool_->acquire();
    if (!curl) {
        response.transport_error = "could not create curl handle";
        return response;
    }

    SendContext upload{&request};
    curl_off_t length = static_cast<curl_off_t>(request.content_length());

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    switch (request.method) {
        case Method::Get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Head:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case Method::Put:
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, length);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload);
            curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
            break;
        case Method::Post:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, length);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload);
            curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
            break;
        case Method::Delete:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers) {
        header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
    }
    // Send bodies straight away instead of waiting on 100-continue
    header_list = curl_slist_append(header_list, "Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    ReceiveContext receive{&response.body, options_.max_response_size};
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &receive);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.request_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verify_ssl ? 2L : 0L);
    if (!options_.ca_bundle.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options_.ca_bundle.c_str());
    }

    CURLcode rc = curl_easy_perform(curl);
    if (receive.overflow) {
        response.transport_error = "response body exceeds " +
                                   std::to_string(options_.max_response_size) + " bytes";
    } else if (rc != CURLE_OK) {
        response.transport_error = curl_easy_strerror(rc);
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<int>(status);
    }

    curl_slist_free_all(header_list);
    pool_->release(curl);
    return response;
}

Response Client::send_with_retry(const Request& request) {
    auto delay = options_.retry_delay;
    int attempts = request.body_source ? 0 : options_.max_retries;

    for (int attempt = 0;; ++attempt) {
        Response response = send(request);
        bool retry = response.network_error() || retryable_status(response.status);
        if (!retry || attempt >= attempts) return response;

        log_info("retrying %s %s after %s (attempt %d of %d)", method_name(request.method),
                 request.url.c_str(), response.describe().c_str(), attempt + 1, attempts);
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

// ============================================================================
// SigV4Signer
// ============================================================================

SigV4Signer::SigV4Signer(std::string access_key, std::string secret_key,
                         std::string region, std::string service,
                         std::string session_token)
    : access_key_(std::move(access_key))
    , secret_key_(std::move(secret_key))
    , region_(std::move(region))
    , service_(std::move(service))
    , session_token_(std::move(session_token)) {}

void SigV4Signer::sign(Request& request) const {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    gmtime_r(&now, &tm_buf);
    char amz_date[32];
    std::strftime(amz_date, sizeof(amz_date), "%Y%m%dT%H%M%SZ", &tm_buf);
    sign_at(request, amz_date);
}

// Query parameters are already encoded; they only need sorting, with
// valueless parameters written as "name="
static std::string canonical_query(const std::string& query) {
    std::multimap<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string item = query.substr(pos, amp - pos);
        size_t eq = item.find('=');
        if (eq == std::string::npos) {
            params.emplace(item, "");
        } else {
            params.emplace(item.substr(0, eq), item.substr(eq + 1));
        }
        pos = amp + 1;
    }

    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) out += '&';
        out += name + "=" + value;
    }
    return out;
}

void SigV4Signer::sign_at(Request& request, const std::string& amz_date) const {
    std::string host, path, query;
    split_url(request.url, host, path, query);
    std::string date = amz_date.substr(0, 8);

    request.headers.erase("authorization");
    request.headers["host"] = host;
    request.headers["x-amz-date"] = amz_date;
    if (!session_token_.empty()) {
        request.headers["x-amz-security-token"] = session_token_;
    }

    auto& payload_hash = request.headers["x-amz-content-sha256"];
    if (payload_hash.empty()) {
        payload_hash = request.body_source ? "UNSIGNED-PAYLOAD" : sha256_hex(request.body);
    }

    std::string canonical_headers, signed_headers;
    for (const auto& [name, value] : request.headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
    }

    std::string canonical_request = std::string(method_name(request.method)) + "\n" +
                                    path + "\n" +
                                    canonical_query(query) + "\n" +
                                    canonical_headers + "\n" +
                                    signed_headers + "\n" +
                                    payload_hash;

    std::string scope = date + "/" + region_ + "/" + service_ + "/aws4_request";
    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" +
                                 sha256_hex(canonical_request);

    std::string secret = "AWS4" + secret_key_;
    auto key = hmac_sha256(std::vector<uint8_t>(secret.begin(), secret.end()), date);
    key = hmac_sha256(key, region_);
    key = hmac_sha256(key, service_);
    key = hmac_sha256(key, "aws4_request");
    auto signature = hmac_sha256(key, string_to_sign);

    request.headers["authorization"] =
        "AWS4-HMAC-SHA256 Credential=" + access_key_ + "/" + scope +
        ", SignedHeaders=" + signed_headers +
        ", Signature=" + to_hex(signature.data(), signature.size());
}

} // namespace bulkcp::net
