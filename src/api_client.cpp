#include "api_client.h"
#include "constants.h"
#include "hash.h"
#include "hex.h"
#include "log.h"
#include "util.h"

#include <algorithm>
#include <climits>
#include <cmath>

namespace mfs {

static int clamp_int(int64_t v) {
    return (int)std::min<int64_t>(std::max<int64_t>(v, INT_MIN), INT_MAX);
}

static std::string response_message(const std::string& body) {
    JNode n;
    if (json_parse(body, n) && json_is_obj(n)) {
        std::string m = json_str(n, "message");
        if (!m.empty()) return m;
    }
    return {};
}

bool UploaderApi::call(const std::string& method, const std::string& path, const std::string& body,
                       const HttpHeaders& extra, JNode& data, Error& e) {
    HttpRequest req;
    req.method = method;
    req.url = base_ + path;
    req.headers = extra;
    req.body = body;

    HttpResponse resp;
    std::string err;
    if (!http_.send(req, resp, err)) {
        return fail(e, ErrKind::RemoteRequestFailure, err);
    }
    if (resp.code < 200 || resp.code >= 300) {
        std::string m = response_message(resp.body);
        return fail(e, ErrKind::RemoteRequestFailure,
                    "HTTP Error: " + std::to_string(resp.code) + (m.empty() ? "" : " (" + m + ")"));
    }

    JNode root;
    if (!json_parse(resp.body, root) || !json_is_obj(root)) {
        return fail(e, ErrKind::RemoteRequestFailure, "malformed JSON response from " + path);
    }
    const JNode* code = json_get(root, "code");
    if (!code || !std::holds_alternative<double>(code->v) || std::get<double>(code->v) != 0.0) {
        std::string m = json_str(root, "message");
        return fail(e, ErrKind::RemoteRequestFailure, m.empty() ? "request to " + path + " failed" : m);
    }
    const JNode* d = json_get(root, "data");
    data = d ? *d : JNode{};
    return true;
}

bool UploaderApi::post_json(const std::string& path, const JNode& body, JNode& data, Error& e) {
    return call("POST", path, json_dump(body), {{"Content-Type", "application/json"}}, data, e);
}

bool UploaderApi::estimate_chunked(const EstimateRequest& req, FeeEstimate& out, Error& e) {
    JObj b;
    b["fileName"] = jstr(req.file_name);
    b["path"] = jstr(req.path);
    b["contentType"] = jstr(req.content_type);
    b["feeRate"] = jnum(req.fee_rate);
    b["storageKey"] = jstr(req.storage_key);

    JNode data;
    if (!post_json(EP_ESTIMATE, jobj(std::move(b)), data, e)) return fail_ctx(e, "Failed to estimate fee");
    out.chunk_size       = (uint64_t)std::max<int64_t>(0, json_int(data, "chunkSize"));
    out.chunk_number     = (uint64_t)std::max<int64_t>(0, json_int(data, "chunkNumber"));
    out.chunk_pre_tx_fee = (uint64_t)std::max<int64_t>(0, json_int(data, "chunkPreTxFee"));
    out.index_pre_tx_fee = (uint64_t)std::max<int64_t>(0, json_int(data, "indexPreTxFee"));
    out.per_chunk_fee    = (uint64_t)std::max<int64_t>(0, json_int(data, "perChunkFee"));
    out.total_fee        = (uint64_t)std::max<int64_t>(0, json_int(data, "totalFee"));
    return true;
}

JNode chunked_upload_body(const ChunkedUploadRequest& req) {
    JObj b;
    b["metaId"] = jstr(req.meta_id);
    b["address"] = jstr(req.address);
    b["fileName"] = jstr(req.file_name);
    b["path"] = jstr(req.path);
    b["operation"] = jstr("create");
    b["contentType"] = jstr(req.content_type);
    b["chunkPreTxHex"] = jstr(req.chunk_pre_tx_hex);
    b["indexPreTxHex"] = jstr(req.index_pre_tx_hex);
    b["mergeTxHex"] = jstr(req.merge_tx_hex);
    b["feeRate"] = jnum(req.fee_rate);
    b["storageKey"] = jstr(req.storage_key);
    return jobj(std::move(b));
}

UploadTask parse_task(const JNode& n) {
    UploadTask t;
    t.task_id = json_str(n, "taskId");
    t.status = json_str(n, "status", "pending");
    t.progress = clamp_int(json_int(n, "progress"));
    t.processed_chunks = json_int(n, "processedChunks");
    t.total_chunks = json_int(n, "totalChunks");
    t.current_step = json_str(n, "currentStep");
    t.index_tx_id = json_str(n, "indexTxId");
    t.error_message = json_str(n, "errorMessage");
    t.file_name = json_str(n, "fileName");
    t.created_at = json_str(n, "createdAt");
    return t;
}

bool UploaderApi::create_chunked_task(const ChunkedUploadRequest& req, UploadTask& out, Error& e) {
    JNode data;
    if (!post_json(EP_CHUNKED_TASK, chunked_upload_body(req), data, e))
        return fail_ctx(e, "Chunked upload task failed");
    // some deployments wrap the task, some return it bare
    const JNode* task = json_get(data, "task");
    out = parse_task(task ? *task : data);
    if (out.task_id.empty()) {
        return fail(e, ErrKind::RemoteRequestFailure, "Chunked upload task failed: response carries no taskId");
    }
    return true;
}

bool UploaderApi::chunked_upload_sync(const ChunkedUploadRequest& req, SyncUploadResult& out, Error& e) {
    JNode body = chunked_upload_body(req);
    std::get<JObj>(body.v)["isBroadcast"] = jbool(true);
    JNode data;
    if (!post_json(EP_CHUNKED_SYNC, body, data, e)) return fail_ctx(e, "Chunked upload failed");
    out.status = json_str(data, "status");
    out.message = json_str(data, "message");
    out.index_tx_id = json_str(data, "indexTxId");
    return true;
}

bool UploaderApi::list_tasks(const std::string& address, int64_t cursor, int size, TaskPage& out, Error& e) {
    std::string path = std::string(EP_TASKS) + "?address=" + url_encode(address) +
                       "&cursor=" + std::to_string(cursor) + "&size=" + std::to_string(size);
    JNode data;
    if (!call("GET", path, "", {}, data, e)) return fail_ctx(e, "Failed to load tasks");
    out.tasks.clear();
    if (const JNode* arr = json_get(data, "tasks")) {
        if (json_is_arr(*arr)) {
            for (const auto& t : std::get<JArr>(arr->v)) out.tasks.push_back(parse_task(t));
        }
    }
    out.next_cursor = json_int(data, "nextCursor");
    out.has_more = json_bool(data, "hasMore");
    return true;
}

bool UploaderApi::multipart_initiate(const std::string& file_name, uint64_t file_size,
                                     const std::string& meta_id, const std::string& address,
                                     MultipartUpload& out, Error& e) {
    JObj b;
    b["fileName"] = jstr(file_name);
    b["fileSize"] = jnum((double)file_size);
    b["metaId"] = jstr(meta_id);
    b["address"] = jstr(address);
    JNode data;
    if (!post_json(EP_MP_INITIATE, jobj(std::move(b)), data, e))
        return fail_ctx(e, "Failed to initiate multipart upload");
    out.upload_id = json_str(data, "uploadId");
    out.key = json_str(data, "key");
    if (out.upload_id.empty() || out.key.empty()) {
        return fail(e, ErrKind::RemoteRequestFailure, "Failed to initiate multipart upload: missing uploadId or key");
    }
    return true;
}

bool UploaderApi::multipart_list_parts(const MultipartUpload& up, std::vector<UploadPart>& out, Error& e) {
    JObj b;
    b["uploadId"] = jstr(up.upload_id);
    b["key"] = jstr(up.key);
    JNode data;
    out.clear();
    if (!post_json(EP_MP_LIST_PARTS, jobj(std::move(b)), data, e)) return fail_ctx(e, "Failed to list parts");
    const JNode* parts = json_get(data, "parts");
    if (!parts || !json_is_arr(*parts)) return true;
    for (const auto& p : std::get<JArr>(parts->v)) {
        const int64_t n = json_int(p, "partNumber");
        if (n < 1 || n > INT_MAX) continue;
        UploadPart part;
        part.part_number = (int)n;
        part.etag = json_str(p, "etag");
        part.size = (uint64_t)std::max<int64_t>(0, json_int(p, "size"));
        out.push_back(part);
    }
    return true;
}

bool UploaderApi::multipart_upload_part(const MultipartUpload& up, int part_number,
                                        const std::string& content_b64, std::string& etag, Error& e) {
    JObj b;
    b["uploadId"] = jstr(up.upload_id);
    b["key"] = jstr(up.key);
    b["partNumber"] = jnum(part_number);
    b["content"] = jstr(content_b64);
    JNode data;
    if (!post_json(EP_MP_UPLOAD_PART, jobj(std::move(b)), data, e))
        return fail_ctx(e, "Failed to upload part " + std::to_string(part_number));
    etag = json_str(data, "etag");
    return true;
}

bool UploaderApi::multipart_complete(const MultipartUpload& up, const std::vector<UploadPart>& parts,
                                     std::string& key_out, Error& e) {
    JArr arr;
    for (const auto& p : parts) {
        JObj o;
        o["partNumber"] = jnum(p.part_number);
        o["etag"] = jstr(p.etag);
        o["size"] = jnum((double)p.size);
        arr.push_back(jobj(std::move(o)));
    }
    JObj b;
    b["uploadId"] = jstr(up.upload_id);
    b["key"] = jstr(up.key);
    b["parts"] = jarr(std::move(arr));
    JNode data;
    if (!post_json(EP_MP_COMPLETE, jobj(std::move(b)), data, e))
        return fail_ctx(e, "Failed to complete multipart upload");
    key_out = json_str(data, "key");
    return true;
}

static void form_field(std::string& body, const std::string& boundary,
                       const std::string& name, const std::string& value) {
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    body += value + "\r\n";
}

static std::string fee_rate_text(double r) {
    JNode n = jnum(r);
    return json_dump(n);
}

bool UploaderApi::direct_upload(const DirectUploadRequest& req, DirectUploadResult& out, Error& e) {
    // boundary derived from the pre-transaction so requests are reproducible
    auto digest = sha256(std::vector<uint8_t>(req.pre_tx_hex.begin(), req.pre_tx_hex.end()));
    const std::string boundary = "----mfsFormBoundary" + to_hex(digest).substr(0, 24);
    std::string body;
    body.reserve(req.content.size() + req.pre_tx_hex.size() + req.merge_tx_hex.size() + 2048);

    std::string fname = req.file_name;
    std::replace(fname.begin(), fname.end(), '"', '_');
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"file\"; filename=\"" + fname + "\"\r\n";
    body += "Content-Type: " + (req.content_type.empty() ? std::string("application/octet-stream") : req.content_type) + "\r\n\r\n";
    body += req.content;
    body += "\r\n";
    form_field(body, boundary, "path", req.path);
    if (!req.merge_tx_hex.empty()) form_field(body, boundary, "mergeTxHex", req.merge_tx_hex);
    form_field(body, boundary, "preTxHex", req.pre_tx_hex);
    form_field(body, boundary, "operation", req.operation);
    form_field(body, boundary, "contentType", req.content_type);
    form_field(body, boundary, "metaId", req.meta_id);
    form_field(body, boundary, "address", req.address);
    form_field(body, boundary, "changeAddress", req.change_address);
    form_field(body, boundary, "feeRate", fee_rate_text(req.fee_rate));
    form_field(body, boundary, "totalInputAmount", std::to_string(req.total_input_amount));
    body += "--" + boundary + "--\r\n";

    JNode data;
    if (!call("POST", EP_DIRECT, body, {{"Content-Type", "multipart/form-data; boundary=" + boundary}}, data, e))
        return fail_ctx(e, "Direct upload failed");
    out.tx_id = json_str(data, "txId");
    out.pin_id = json_str(data, "pinId");
    out.status = json_str(data, "status");
    if (out.pin_id.empty() && !out.tx_id.empty()) out.pin_id = out.tx_id + "i0";
    return true;
}

}
