#pragma once

#include "bulkcp/core/error.hpp"
#include "bulkcp/net/http.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace bulkcp {

// Result of a stat operation. A path that is neither a file nor a directory
// fails with NotFound. Object stores can report both flags at once when a key
// is an object and also a non-empty prefix.
struct StatResult : Status {
    bool is_file = false;
    bool is_directory = false;
    uint64_t size = 0;
    std::string etag;
};

// Entry in a recursive listing; `url` is absolute, in the form the listing
// was requested with.
struct ListEntry {
    std::string url;
    uint64_t size = 0;
    std::string etag;
};

struct ListResult : Status {
    std::vector<ListEntry> entries;
};

// Bytes moved by a single read or write call. A successful read of 0 bytes
// means end of stream.
struct IoResult : Status {
    size_t bytes = 0;
};

class ReadStream {
public:
    virtual ~ReadStream() = default;
    virtual IoResult read(std::span<uint8_t> buffer) = 0;
};

// Sink for one destination object (or one part of it). Nothing becomes
// visible at the destination until close() succeeds; abort() or destroying
// an unclosed stream discards everything written.
class WriteStream {
public:
    virtual ~WriteStream() = default;
    virtual IoResult write(std::span<const uint8_t> data) = 0;
    virtual Status close() = 0;
    virtual void abort() = 0;
    virtual uint64_t bytes_written() const = 0;
};

struct OpenReadResult : Status {
    std::unique_ptr<ReadStream> stream;
};

struct OpenWriteResult : Status {
    std::unique_ptr<WriteStream> stream;
};

struct WriteOptions {
    // Create missing parent directories (local filesystem only)
    bool create_parents = false;

    // Exact object size; object store uploads stream with a fixed length
    std::optional<uint64_t> size;
};

// A destination object assembled from independently written parts. Parts may
// be opened and written concurrently from different threads; complete()
// commits the object once, after every part has been closed.
class MultipartUpload {
public:
    explicit MultipartUpload(std::vector<uint64_t> part_sizes);
    virtual ~MultipartUpload() = default;

    MultipartUpload(const MultipartUpload&) = delete;
    MultipartUpload& operator=(const MultipartUpload&) = delete;

    virtual OpenWriteResult open_part(size_t index) = 0;
    virtual Status complete() = 0;
    virtual void abort() = 0;

    size_t part_count() const { return planned_sizes_.size(); }
    const std::vector<uint64_t>& planned_sizes() const { return planned_sizes_; }

    // Offset of a part within the final object
    uint64_t part_offset(size_t index) const;

protected:
    // Called by part streams when a part lands
    void record_part(size_t index, uint64_t size);

    // PartSizeMismatch unless every part landed with its planned size
    Status check_part_sizes() const;

private:
    std::vector<uint64_t> planned_sizes_;
    std::vector<std::optional<uint64_t>> committed_sizes_;
    mutable std::mutex mutex_;
};

struct MultipartResult : Status {
    std::unique_ptr<MultipartUpload> upload;
};

// Uniform capability interface over one storage system. Every operation is
// keyed by a full URL and is safe to call from many threads at once.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    virtual StatResult stat(const std::string& url) = 0;

    // Every object below a directory or prefix, sorted by URL
    virtual ListResult list_recursive(const std::string& url) = 0;

    // Read `length` bytes starting at `offset`; nullopt reads to the end
    virtual OpenReadResult open_read(const std::string& url, uint64_t offset,
                                     std::optional<uint64_t> length) = 0;

    virtual OpenWriteResult open_write(const std::string& url, const WriteOptions& options) = 0;

    virtual MultipartResult create_multipart(const std::string& url,
                                             const std::vector<uint64_t>& part_sizes,
                                             const WriteOptions& options) = 0;

    // Release connections and cached credentials
    virtual void close() {}
};

// ============================================================================
// Generic streams used by the object store backends
// ============================================================================

struct FetchResult : Status {
    std::vector<uint8_t> data;
};

// Reads a byte range through repeated ranged fetches. The fetch callback
// receives an absolute offset and a maximum length and may return fewer bytes
// only at the end of the object.
class RangedReadStream : public ReadStream {
public:
    using Fetch = std::function<FetchResult(uint64_t offset, uint64_t length)>;

    RangedReadStream(Fetch fetch, uint64_t offset, std::optional<uint64_t> length);

    IoResult read(std::span<uint8_t> buffer) override;

private:
    Fetch fetch_;
    uint64_t position_;
    std::optional<uint64_t> remaining_;
    bool eof_ = false;
};

// Bounded byte hand-off between a writer thread and the thread sending a
// request body. At most `capacity` bytes are held at once. Until finish() the
// reader is kept one byte behind the writer, so a fixed-length request cannot
// complete before the writer closes.
class BodyPipe {
public:
    explicit BodyPipe(size_t capacity);

    BodyPipe(const BodyPipe&) = delete;
    BodyPipe& operator=(const BodyPipe&) = delete;

    // Blocks while the pipe is full. False once the reader stopped or the
    // pipe was cancelled.
    bool push(std::span<const uint8_t> data);
    void finish();
    void cancel();

    // Bytes copied into `dst`, 0 at end of body, net::ABORT_UPLOAD after cancel()
    size_t pull(uint8_t* dst, size_t max);

    // Reader side is gone; wakes a blocked push()
    void close_reader();

    size_t peak_buffered() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::vector<uint8_t> ring_;
    size_t head_ = 0;
    size_t buffered_ = 0;
    size_t peak_ = 0;
    bool finished_ = false;
    bool cancelled_ = false;
    bool reader_closed_ = false;
};

// Uploads a body of known size while it is being written. `send` runs on a
// sender thread, started by the first write, and drains the pipe into one
// request. close() fails with PartSizeMismatch unless exactly `size` bytes
// were written.
class StreamingWriteStream : public WriteStream {
public:
    using Send = std::function<Status(BodyPipe& body, uint64_t size)>;

    StreamingWriteStream(uint64_t size, size_t buffer_limit, Send send);
    ~StreamingWriteStream() override;

    IoResult write(std::span<const uint8_t> data) override;
    Status close() override;
    void abort() override;
    uint64_t bytes_written() const override { return written_; }

    size_t peak_buffered() const { return pipe_.peak_buffered(); }

private:
    void start();
    Status stop_sender();

    BodyPipe pipe_;
    Send send_;
    uint64_t size_;
    uint64_t written_ = 0;
    std::thread sender_;
    Status sent_;
    bool finished_ = false;
};

// Factory for creating storage backends from configuration parameters
class StorageBackendFactory {
public:
    using Params = std::map<std::string, std::string>;

    // Throws std::runtime_error for an unknown type or invalid parameters
    static std::unique_ptr<StorageBackend> create(const std::string& type, const Params& params);

    static std::unique_ptr<StorageBackend> create_local();
    static std::unique_ptr<StorageBackend> create_s3(const Params& params);
    static std::unique_ptr<StorageBackend> create_azure(const Params& params);
    static std::unique_ptr<StorageBackend> create_gcs(const Params& params);
};

} // namespace bulkcp
