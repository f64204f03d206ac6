#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bulkcp::net {

enum class Method {
    Get,
    Head,
    Put,
    Post,
    Delete
};

const char* method_name(Method method);

// 429 and the 5xx gateway/availability statuses
bool retryable_status(int status);

std::string url_encode(const std::string& str);
std::string url_decode(const std::string& str);

/// Percent-encode each path segment while preserving '/' separators.
std::string url_encode_path(const std::string& path);

std::string base64_encode(const std::string& data);
std::string base64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64_decode(const std::string& encoded);

std::string sha256_hex(const std::string& data);
std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data);

// "bytes=first-last", both ends inclusive
std::string byte_range(uint64_t first, uint64_t last);

// Header names are kept lowercase
using Headers = std::map<std::string, std::string>;

// Fills `dst` with up to `max` body bytes and returns the count; 0 ends the
// body and ABORT_UPLOAD cancels the request.
using BodySource = std::function<size_t(uint8_t* dst, size_t max)>;
inline constexpr size_t ABORT_UPLOAD = static_cast<size_t>(-1);

struct Request {
    Method method = Method::Get;
    std::string url;
    Headers headers;

    std::string body;

    // Streamed body of exactly `body_length` bytes; replaces `body` when set
    BodySource body_source;
    uint64_t body_length = 0;

    uint64_t content_length() const { return body_source ? body_length : body.size(); }

    static Request get(const std::string& url);
    static Request head(const std::string& url);
    static Request put(const std::string& url, std::string body = {});
    static Request post(const std::string& url, std::string body = {});
    static Request del(const std::string& url);
};

struct Response {
    int status = 0;
    Headers headers;
    std::string body;

    // Why the exchange failed before or without an HTTP status
    std::string transport_error;

    bool ok() const { return status >= 200 && status < 300; }
    bool network_error() const { return status == 0; }

    // Empty when the header is absent
    std::string header(const std::string& name) const;

    // "HTTP 404" or the transport error text
    std::string describe() const;
};

struct ClientOptions {
    std::string user_agent = "bulkcp/1.0";
    bool verify_ssl = true;
    std::string ca_bundle;

    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds request_timeout{300};

    int max_retries = 3;
    std::chrono::milliseconds retry_delay{500};

    size_t max_response_size = 256 * 1024 * 1024;
};

/// Blocking HTTP client. Curl handles are pooled so concurrent transfers
/// reuse connections.
class Client {
public:
    explicit Client(ClientOptions options);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    Response send(const Request& request);

    /// Retries network errors and retryable statuses with doubling delays.
    /// Requests with a streamed body are sent once since the source cannot
    /// be rewound.
    Response send_with_retry(const Request& request);

    const ClientOptions& options() const { return options_; }

private:
    struct Pool;

    ClientOptions options_;
    std::unique_ptr<Pool> pool_;
};

/// AWS Signature Version 4. Signs every header present on the request.
class SigV4Signer {
public:
    SigV4Signer(std::string access_key, std::string secret_key,
                std::string region, std::string service,
                std::string session_token = {});

    void sign(Request& request) const;

    // `amz_date` is "YYYYMMDDTHHMMSSZ"
    void sign_at(Request& request, const std::string& amz_date) const;

private:
    std::string access_key_;
    std::string secret_key_;
    std::string region_;
    std::string service_;
    std::string session_token_;
};

} // namespace bulkcp::net
