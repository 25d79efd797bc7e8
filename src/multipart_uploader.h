#pragma once
#include <cstdint>
#include <fstream>
#include <string>

#include "api_client.h"
#include "errors.h"
#include "progress.h"
#include "session_store.h"
#include "upload_types.h"

namespace mfs {

// Random-access byte source for the file being uploaded.
class FileSource {
public:
    virtual ~FileSource() = default;
    virtual uint64_t size() const = 0;
    virtual bool read(uint64_t offset, size_t len, std::string& out, std::string& err) = 0;
};

class DiskFileSource : public FileSource {
public:
    bool open(const std::string& path, std::string& err);
    uint64_t size() const override { return size_; }
    bool read(uint64_t offset, size_t len, std::string& out, std::string& err) override;

private:
    std::ifstream f_;
    std::string path_;
    uint64_t size_{0};
};

class MemoryFileSource : public FileSource {
public:
    explicit MemoryFileSource(std::string data) : data_(std::move(data)) {}
    uint64_t size() const override { return data_.size(); }
    bool read(uint64_t offset, size_t len, std::string& out, std::string& err) override;

private:
    std::string data_;
};

// Uploads a file to object storage in 1 MiB parts, resuming a previous
// attempt for the same (file, size, metaId, address) when one is on record.
class MultipartUploader {
public:
    MultipartUploader(UploaderApi& api, SessionStore& sessions, ProgressSink* sink = nullptr)
        : api_(api), sessions_(sessions), sink_(sink) {}

    bool upload(const FileDescriptor& file, FileSource& src,
                const std::string& meta_id, const std::string& address,
                std::string& storage_key, Error& e);

    int reused_parts() const { return reused_; }
    int uploaded_parts() const { return uploaded_; }

private:
    UploaderApi& api_;
    SessionStore& sessions_;
    ProgressSink* sink_;
    int reused_{0};
    int uploaded_{0};

    void report(ProgressPhase phase, int part, int total, uint64_t done, uint64_t total_bytes,
                const ThroughputMeter& meter);
};

}
