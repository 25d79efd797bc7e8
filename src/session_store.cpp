#include "session_store.h"
#include "constants.h"
#include "json.h"
#include "log.h"
#include "util.h"

#include <vector>

namespace mfs {

std::string session_key(const std::string& file_name, uint64_t file_size,
                        const std::string& meta_id, const std::string& address) {
    return "multipart_upload_" + file_name + "_" + std::to_string(file_size) + "_" + meta_id + "_" + address;
}

std::string encode_session(const UploadSession& s) {
    JObj o;
    o["uploadId"] = jstr(s.upload_id);
    o["key"] = jstr(s.key);
    o["fileName"] = jstr(s.file_name);
    o["fileSize"] = jnum((double)s.file_size);
    o["metaId"] = jstr(s.meta_id);
    o["address"] = jstr(s.address);
    o["timestamp"] = jnum((double)s.timestamp_ms);
    return json_dump(jobj(std::move(o)));
}

bool decode_session(const std::string& raw, UploadSession& out) {
    JNode n;
    if (!json_parse(raw, n) || !json_is_obj(n)) return false;
    out.upload_id = json_str(n, "uploadId");
    out.key = json_str(n, "key");
    if (out.upload_id.empty() || out.key.empty()) return false;
    out.file_name = json_str(n, "fileName");
    out.file_size = (uint64_t)json_int(n, "fileSize");
    out.meta_id = json_str(n, "metaId");
    out.address = json_str(n, "address");
    out.timestamp_ms = json_int(n, "timestamp");
    return true;
}

SessionStore::SessionStore(KV& kv, Clock clock)
    : kv_(kv), clock_(clock ? std::move(clock) : Clock(now_ms)) {}

bool SessionStore::expired(const UploadSession& s) const {
    return clock_() - s.timestamp_ms > SESSION_TTL_MS;
}

bool SessionStore::load(const std::string& key, UploadSession& out) {
    std::string raw;
    if (!kv_.get(key, raw)) return false;

    std::string err;
    UploadSession s;
    if (!decode_session(raw, s)) {
        log_warn(LogCategory::STORE, "session: dropping corrupt record " + key);
        if (!kv_.del(key, err)) log_warn(LogCategory::STORE, "session: " + err);
        return false;
    }
    if (expired(s)) {
        log_info(LogCategory::STORE, "session: " + key + " expired");
        if (!kv_.del(key, err)) log_warn(LogCategory::STORE, "session: " + err);
        return false;
    }
    out = std::move(s);
    return true;
}

bool SessionStore::save(const std::string& key, UploadSession s, Error& e) {
    if (s.timestamp_ms == 0) s.timestamp_ms = clock_();
    std::string err;
    if (!kv_.put(key, encode_session(s), err)) {
        return fail(e, ErrKind::DependencyUnavailable, "cannot persist upload session: " + err);
    }
    MFS_LOG_DEBUG(LogCategory::STORE, "session: saved " + key + " (uploadId " + s.upload_id + ")");
    return true;
}

bool SessionStore::remove(const std::string& key, Error& e) {
    std::string err;
    if (!kv_.del(key, err)) {
        return fail(e, ErrKind::DependencyUnavailable, "cannot remove upload session: " + err);
    }
    return true;
}

size_t SessionStore::purge_expired() {
    std::vector<std::string> stale;
    kv_.scan([&](const std::string& k, const std::string& v) {
        UploadSession s;
        if (!decode_session(v, s) || expired(s)) stale.push_back(k);
        return true;
    });
    std::string err;
    size_t removed = 0;
    for (const auto& k : stale) {
        if (kv_.del(k, err)) ++removed;
        else log_warn(LogCategory::STORE, "session: " + err);
    }
    const KV::Stats st = kv_.stats();
    if (st.log_records > 2 * st.live_keys + 16) {
        if (!kv_.compact(err)) log_warn(LogCategory::STORE, "session: compact failed: " + err);
    }
    if (removed) log_info(LogCategory::STORE, "session: purged " + std::to_string(removed) + " stale records");
    return removed;
}

}
