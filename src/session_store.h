#pragma once
#include <cstdint>
#include <functional>
#include <string>

#include "errors.h"
#include "kv.h"

namespace mfs {

// Resumable multipart state for one (file, size, metaId, address) tuple.
struct UploadSession {
    std::string upload_id;
    std::string key;
    std::string file_name;
    uint64_t    file_size{0};
    std::string meta_id;
    std::string address;
    int64_t     timestamp_ms{0};
};

std::string session_key(const std::string& file_name, uint64_t file_size,
                        const std::string& meta_id, const std::string& address);

std::string encode_session(const UploadSession& s);
bool decode_session(const std::string& raw, UploadSession& out);

class SessionStore {
public:
    using Clock = std::function<int64_t()>;

    explicit SessionStore(KV& kv, Clock clock = nullptr);

    // Absent, corrupt and expired records all read as "no session"; the
    // latter two are deleted on the way.
    bool load(const std::string& key, UploadSession& out);
    bool save(const std::string& key, UploadSession s, Error& e);
    bool remove(const std::string& key, Error& e);

    // Drops expired or corrupt records and compacts the backing file.
    size_t purge_expired();

    int64_t now() const { return clock_(); }

private:
    KV& kv_;
    Clock clock_;

    bool expired(const UploadSession& s) const;
};

}
