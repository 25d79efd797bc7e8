#pragma once
#include <string>
#include <vector>

#include "errors.h"
#include "http_client.h"
#include "json.h"
#include "upload_types.h"

namespace mfs {

struct EstimateRequest {
    std::string file_name;
    std::string path;
    std::string content_type;
    double      fee_rate{1.0};
    std::string storage_key;
};

// Body shared by the async task and the synchronous chunked upload.
struct ChunkedUploadRequest {
    std::string meta_id;
    std::string address;
    std::string file_name;
    std::string path;
    std::string content_type;
    std::string chunk_pre_tx_hex;
    std::string index_pre_tx_hex;
    std::string merge_tx_hex;
    double      fee_rate{1.0};
    std::string storage_key;
};

struct SyncUploadResult {
    std::string status;
    std::string message;
    std::string index_tx_id;
};

struct TaskPage {
    std::vector<UploadTask> tasks;
    int64_t next_cursor{0};
    bool    has_more{false};
};

struct MultipartUpload {
    std::string upload_id;
    std::string key;
};

struct DirectUploadRequest {
    std::string file_name;
    std::string content_type;
    std::string content;          // raw file bytes
    std::string path;
    std::string merge_tx_hex;     // empty when no merge was needed
    std::string pre_tx_hex;
    std::string operation{"create"};
    std::string meta_id;
    std::string address;
    std::string change_address;
    double      fee_rate{1.0};
    uint64_t    total_input_amount{0};
};

struct DirectUploadResult {
    std::string tx_id;
    std::string pin_id;
    std::string status;
};

// Client for the storage backend. Every call succeeds only on HTTP 2xx with
// `code == 0`; otherwise the backend `message` becomes a RemoteRequestFailure.
class UploaderApi {
public:
    UploaderApi(HttpTransport& http, std::string base_url)
        : http_(http), base_(std::move(base_url)) {}

    bool estimate_chunked(const EstimateRequest& req, FeeEstimate& out, Error& e);
    bool create_chunked_task(const ChunkedUploadRequest& req, UploadTask& out, Error& e);
    bool chunked_upload_sync(const ChunkedUploadRequest& req, SyncUploadResult& out, Error& e);
    bool list_tasks(const std::string& address, int64_t cursor, int size, TaskPage& out, Error& e);

    bool multipart_initiate(const std::string& file_name, uint64_t file_size,
                            const std::string& meta_id, const std::string& address,
                            MultipartUpload& out, Error& e);
    bool multipart_list_parts(const MultipartUpload& up, std::vector<UploadPart>& out, Error& e);
    bool multipart_upload_part(const MultipartUpload& up, int part_number,
                               const std::string& content_b64, std::string& etag, Error& e);
    // key_out is the backend's storage key, empty when it did not send one.
    bool multipart_complete(const MultipartUpload& up, const std::vector<UploadPart>& parts,
                            std::string& key_out, Error& e);

    bool direct_upload(const DirectUploadRequest& req, DirectUploadResult& out, Error& e);

    const std::string& base_url() const { return base_; }

private:
    HttpTransport& http_;
    std::string base_;

    bool call(const std::string& method, const std::string& path, const std::string& body,
              const HttpHeaders& extra, JNode& data, Error& e);
    bool post_json(const std::string& path, const JNode& body, JNode& data, Error& e);
};

UploadTask parse_task(const JNode& n);
JNode chunked_upload_body(const ChunkedUploadRequest& req);

}
