#pragma once

#include <cstddef>
#include <cstdint>

namespace bulkcp::constants {

// Scheduler defaults
constexpr size_t DEFAULT_MAX_SIMULTANEOUS_TRANSFERS = 75;
constexpr int DEFAULT_CANCEL_GRACE_SECONDS = 30;

// Planner / copy loop defaults
constexpr uint64_t DEFAULT_PART_SIZE = 128ULL * 1024 * 1024;       // 128MB
constexpr size_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;              // 8MB

// Bytes held between the copy loop and an object store upload
constexpr size_t UPLOAD_BUFFER_SIZE = 2 * DEFAULT_CHUNK_SIZE;

// Object store limits
constexpr size_t GCS_MAX_COMPOSE_SOURCES = 32;
constexpr size_t S3_MAX_PARTS = 10000;
constexpr size_t AZURE_MAX_BLOCKS = 50000;
constexpr int LIST_PAGE_SIZE = 1000;

// HTTP request defaults
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 300;
constexpr int DEFAULT_HTTP_MAX_RETRIES = 3;

// Progress / metrics
constexpr int DEFAULT_PROGRESS_INTERVAL_MS = 500;
constexpr int DEFAULT_METRICS_INTERVAL_SECONDS = 15;

constexpr const char* DEFAULT_S3_REGION = "us-east-1";
constexpr const char* AZURE_API_VERSION = "2020-10-02";
constexpr const char* GCS_TOKEN_URI = "https://oauth2.googleapis.com/token";

} // namespace bulkcp::constants
