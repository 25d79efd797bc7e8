#pragma once
#include "kv.h"
#include <unordered_map>
#include <fstream>
#include <mutex>
#include <vector>

namespace mfs {

// Single-file append-only store; every live value is kept in memory.
//
//   header:  "MFSK" | version u32 (LE)
//   record:  op u8 (1 put, 0 del) | klen u32 | vlen u32 | key | val | crc32 u32
//
// Replaying stops at the first short or bad-crc record; whatever follows it
// is cut off before the file is reopened for appending.
class LogKV final : public KV {
public:
    LogKV() = default;
    ~LogKV() override { close(); }

    bool open(const std::string& path, std::string& err) override;
    void close() override;

    bool get(const std::string& key, std::string& out) const override;
    bool put(const std::string& key, const std::string& val, std::string& err) override;
    bool del(const std::string& key, std::string& err) override;

    void scan(const Visitor& fn) const override;
    bool compact(std::string& err) override;

    Stats stats() const override;

private:
    mutable std::mutex mu_;
    std::string path_;
    std::fstream log_;
    std::unordered_map<std::string, std::string> live_;
    uint64_t records_{0};
    uint64_t bytes_{0};

    bool append_record(uint8_t op, const std::string& k, const std::string& v, std::string& err);
    static std::vector<uint8_t> encode_record(uint8_t op, const std::string& k, const std::string& v);
    static uint32_t crc32(const uint8_t* p, size_t n);
};

}
