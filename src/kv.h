#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace mfs {

// String key/value storage used for upload sessions.
class KV {
public:
    virtual ~KV() = default;

    virtual bool open(const std::string& path, std::string& err) = 0;
    virtual void close() = 0;

    // false when absent
    virtual bool get(const std::string& key, std::string& out) const = 0;
    virtual bool put(const std::string& key, const std::string& val, std::string& err) = 0;
    // Deleting an absent key succeeds.
    virtual bool del(const std::string& key, std::string& err) = 0;

    // Visits live entries in no particular order until fn returns false.
    using Visitor = std::function<bool(const std::string& key, const std::string& val)>;
    virtual void scan(const Visitor& fn) const = 0;

    // Drops superseded and deleted records from the backing storage.
    virtual bool compact(std::string& err) = 0;

    struct Stats {
        uint64_t live_keys{0};
        uint64_t log_records{0};   // records in storage, live or superseded
        uint64_t file_bytes{0};
    };
    virtual Stats stats() const = 0;
};

}
