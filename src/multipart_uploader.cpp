#include "multipart_uploader.h"
#include "constants.h"
#include "fee_estimator.h"
#include "hash.h"
#include "log.h"

#include <algorithm>
#include <map>

namespace mfs {

bool DiskFileSource::open(const std::string& path, std::string& err) {
    path_ = path;
    f_.open(path, std::ios::in | std::ios::binary);
    if (!f_.good()) { err = "cannot open " + path; return false; }
    f_.seekg(0, std::ios::end);
    const std::streamoff end = f_.tellg();
    if (end < 0) { err = "cannot size " + path; return false; }
    size_ = (uint64_t)end;
    f_.seekg(0, std::ios::beg);
    return true;
}

bool DiskFileSource::read(uint64_t offset, size_t len, std::string& out, std::string& err) {
    if (offset > size_ || len > size_ - offset) { err = "read past end of " + path_; return false; }
    out.assign(len, '\0');
    f_.clear();
    f_.seekg((std::streamoff)offset, std::ios::beg);
    if (len) f_.read(&out[0], (std::streamsize)len);
    if ((size_t)f_.gcount() != len) { err = "read failed on " + path_; return false; }
    return true;
}

bool MemoryFileSource::read(uint64_t offset, size_t len, std::string& out, std::string& err) {
    if (offset > data_.size() || len > data_.size() - offset) { err = "read past end of buffer"; return false; }
    out = data_.substr((size_t)offset, len);
    return true;
}

void MultipartUploader::report(ProgressPhase phase, int part, int total, uint64_t done,
                               uint64_t total_bytes, const ThroughputMeter& meter) {
    if (!sink_) return;
    ProgressEvent ev;
    ev.phase = phase;
    ev.current_part = part;
    ev.total_parts = total;
    ev.uploaded_bytes = done;
    ev.total_bytes = total_bytes;
    ev.bytes_per_sec = meter.rate(done);
    ev.percent = total_bytes ? 100.0 * (double)done / (double)total_bytes : 0.0;
    sink_->on_progress(ev);
}

bool MultipartUploader::upload(const FileDescriptor& file, FileSource& src,
                               const std::string& meta_id, const std::string& address,
                               std::string& storage_key, Error& e) {
    reused_ = 0;
    uploaded_ = 0;
    if (file.size == 0) return fail(e, ErrKind::InvalidInput, "Failed to upload file: file is empty");
    if (src.size() != file.size) {
        return fail(e, ErrKind::InvalidInput, "Failed to upload file: size changed since it was selected");
    }

    const std::string skey = session_key(file.name, file.size, meta_id, address);
    MultipartUpload up;
    std::map<int, UploadPart> committed;

    UploadSession sess;
    if (sessions_.load(skey, sess)) {
        up.upload_id = sess.upload_id;
        up.key = sess.key;
        std::vector<UploadPart> listed;
        Error le;
        if (api_.multipart_list_parts(up, listed, le)) {
            for (const auto& p : listed) committed[p.part_number] = p;
            log_info(LogCategory::UPLOAD, "resuming upload " + up.upload_id + " with " +
                     std::to_string(committed.size()) + " committed parts");
        } else {
            log_warn(LogCategory::UPLOAD, "cannot list parts of " + up.upload_id + ", starting over: " + le.message);
            Error re;
            if (!sessions_.remove(skey, re)) log_warn(LogCategory::STORE, re.message);
        }
    }

    if (committed.empty()) {
        if (!api_.multipart_initiate(file.name, file.size, meta_id, address, up, e))
            return fail_ctx(e, "Failed to upload file");
        UploadSession ns;
        ns.upload_id = up.upload_id;
        ns.key = up.key;
        ns.file_name = file.name;
        ns.file_size = file.size;
        ns.meta_id = meta_id;
        ns.address = address;
        if (!sessions_.save(skey, ns, e)) return fail_ctx(e, "Failed to upload file");
        log_info(LogCategory::UPLOAD, "initiated upload " + up.upload_id + " for " + file.name);
    }

    const int total_parts = (int)chunk_count(file.size, CHUNK_SIZE);
    std::vector<UploadPart> parts;
    parts.reserve((size_t)total_parts);
    uint64_t done = 0;
    ThroughputMeter meter;
    meter.start();
    report(ProgressPhase::Uploading, 0, total_parts, 0, file.size, meter);

    std::string chunk, err;
    for (int n = 1; n <= total_parts; ++n) {
        const uint64_t start = (uint64_t)(n - 1) * CHUNK_SIZE;
        const uint64_t len = std::min<uint64_t>(CHUNK_SIZE, file.size - start);

        auto it = committed.find(n);
        if (it != committed.end()) {
            parts.push_back(UploadPart{n, it->second.etag, len});
            ++reused_;
        } else {
            if (!src.read(start, (size_t)len, chunk, err)) {
                return fail(e, ErrKind::InvalidInput, "Failed to upload file: " + err);
            }
            std::string etag;
            if (!api_.multipart_upload_part(up, n, base64_encode((const uint8_t*)chunk.data(), chunk.size()), etag, e))
                return fail_ctx(e, "Failed to upload file");
            parts.push_back(UploadPart{n, etag, len});
            ++uploaded_;
            MFS_LOG_DEBUG(LogCategory::UPLOAD, "part " + std::to_string(n) + "/" + std::to_string(total_parts) + " uploaded");
        }
        done += len;
        report(ProgressPhase::Uploading, n, total_parts, done, file.size, meter);
    }

    std::sort(parts.begin(), parts.end(),
              [](const UploadPart& a, const UploadPart& b){ return a.part_number < b.part_number; });
    report(ProgressPhase::Completing, total_parts, total_parts, file.size, file.size, meter);

    std::string key_out;
    if (!api_.multipart_complete(up, parts, key_out, e)) return fail_ctx(e, "Failed to upload file");
    storage_key = key_out.empty() ? up.key : key_out;

    Error re;
    if (!sessions_.remove(skey, re)) log_warn(LogCategory::STORE, re.message);
    log_info(LogCategory::UPLOAD, "upload complete: " + storage_key + " (" + std::to_string(uploaded_) +
             " uploaded, " + std::to_string(reused_) + " reused)");
    return true;
}

}
