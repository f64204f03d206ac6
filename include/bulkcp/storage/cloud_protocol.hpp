#pragma once

#include "bulkcp/core/error.hpp"
#include "bulkcp/net/http.hpp"
#include "bulkcp/storage/backend.hpp"
#include "bulkcp/storage/url.hpp"

#include <string>
#include <vector>

// Request building and response parsing for the object store backends, kept
// free of I/O so they can be checked offline.

namespace bulkcp::xml {

// Content of the first <tag>...</tag> at or after start_pos, or ""
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0);

struct ElementRange {
    size_t content_start;
    size_t content_end;
    size_t element_end;
};

// Every top-level <tag>...</tag> occurrence
std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag);

std::string decode_entities(const std::string& s);
std::string escape(const std::string& s);

} // namespace bulkcp::xml

namespace bulkcp {

// One page of a paginated listing
struct ListPage : Status {
    std::vector<ListEntry> entries;
    std::string next_token;  // empty on the last page
};

// ----------------------------------------------------------------------------
// S3
// ----------------------------------------------------------------------------

struct S3Endpoint {
    std::string region = "us-east-1";
    std::string endpoint;        // empty for AWS, custom for MinIO and friends
    bool use_path_style = false;
};

std::string s3_object_url(const S3Endpoint& ep, const std::string& bucket, const std::string& key);

ListPage parse_s3_list_page(const std::string& body, const url::ObjectLocation& where);

// ETags in part order, quoted as S3 expects
std::string s3_complete_multipart_body(const std::vector<std::string>& etags);

std::string ensure_etag_quotes(const std::string& etag);

// ----------------------------------------------------------------------------
// Azure Blob
// ----------------------------------------------------------------------------

std::string azure_blob_url(const std::string& endpoint, const std::string& account,
                           const std::string& container, const std::string& blob);

// Sets x-ms-date and x-ms-version
void azure_add_common_headers(net::Request& request);

// SharedKey string-to-sign; `resource` is "/account/container[/blob]"
std::string azure_string_to_sign(const net::Request& request, const std::string& verb,
                                 const std::string& resource);

// Fixed-width base64 block id for block `index`
std::string azure_block_id(size_t index);

std::string azure_block_list_body(size_t block_count);

ListPage parse_azure_list_page(const std::string& body, const url::ObjectLocation& where);

// ----------------------------------------------------------------------------
// Google Cloud Storage
// ----------------------------------------------------------------------------

std::string gcs_part_object_name(const std::string& object, size_t index);

std::string gcs_compose_body(const std::vector<std::string>& sources);

ListPage parse_gcs_list_page(const std::string& body, const url::ObjectLocation& where);

std::string base64url_encode(const std::vector<uint8_t>& data);

} // namespace bulkcp
