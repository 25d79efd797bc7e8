#include "kv_log.h"
#include "log.h"
#include <cstdio>
#include <cstring>
#include <iterator>

namespace mfs {

static const char KV_MAGIC[4] = {'M','F','S','K'};
static constexpr uint32_t KV_VERSION = 1;
static constexpr uint64_t KV_HEADER = 8;

static inline void put_u32(std::vector<uint8_t>& b, uint32_t x){
    for(int i=0;i<4;i++) b.push_back((uint8_t)((x>>(8*i))&0xFF));
}
static inline uint32_t get_u32(const uint8_t* b){
    return (uint32_t)b[0] | ((uint32_t)b[1]<<8) | ((uint32_t)b[2]<<16) | ((uint32_t)b[3]<<24);
}

uint32_t LogKV::crc32(const uint8_t* data, size_t len){
    uint32_t c = 0xFFFFFFFFu;
    for(size_t i=0;i<len;i++){
        c ^= data[i];
        for(int k=0;k<8;k++) c = (c >> 1) ^ (0xEDB88320u & (0u - (c & 1u)));
    }
    return ~c;
}

std::vector<uint8_t> LogKV::encode_record(uint8_t op, const std::string& k, const std::string& v){
    std::vector<uint8_t> buf;
    buf.reserve(1+4+4+k.size()+v.size()+4);
    buf.push_back(op);
    put_u32(buf, (uint32_t)k.size());
    put_u32(buf, (uint32_t)v.size());
    buf.insert(buf.end(), k.begin(), k.end());
    buf.insert(buf.end(), v.begin(), v.end());
    put_u32(buf, crc32(buf.data(), buf.size()));
    return buf;
}

static bool write_header(std::fstream& f){
    std::vector<uint8_t> h(KV_MAGIC, KV_MAGIC + 4);
    put_u32(h, KV_VERSION);
    f.write((const char*)h.data(), (std::streamsize)h.size());
    return f.good();
}

bool LogKV::open(const std::string& path, std::string& err){
    std::lock_guard<std::mutex> lk(mu_);
    if (log_.is_open()) log_.close();
    path_ = path;
    live_.clear(); records_ = 0; bytes_ = 0;

    std::vector<uint8_t> data;
    {
        std::ifstream in(path_, std::ios::binary);
        if (in.good()) data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    if (data.empty()) {
        std::fstream nf(path_, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!nf.good() || !write_header(nf)){ err = "kv: cannot create " + path_; return false; }
        nf.close();
        data.clear();
        bytes_ = KV_HEADER;
    } else {
        if (data.size() < KV_HEADER || std::memcmp(data.data(), KV_MAGIC, 4) != 0){ err = "kv: bad magic in " + path_; return false; }
        if (get_u32(data.data() + 4) != KV_VERSION){ err = "kv: unsupported version"; return false; }

        size_t pos = KV_HEADER;
        while (pos < data.size()) {
            if (data.size() - pos < 13) break;
            const uint8_t op = data[pos];
            const uint32_t klen = get_u32(&data[pos+1]);
            const uint32_t vlen = get_u32(&data[pos+5]);
            const uint64_t rec = 9ULL + klen + vlen + 4ULL;
            if (rec > data.size() - pos) break;
            const uint32_t want = get_u32(&data[pos + 9 + klen + vlen]);
            if (crc32(&data[pos], (size_t)(9 + klen + vlen)) != want) break;

            std::string k((const char*)&data[pos+9], klen);
            if (op == 1) live_[k] = std::string((const char*)&data[pos+9+klen], vlen);
            else live_.erase(k);
            records_++;
            pos += (size_t)rec;
        }
        bytes_ = pos;
        if (pos < data.size()) {
            log_warn(LogCategory::STORE, "kv: dropping " + std::to_string(data.size() - pos) +
                     " trailing bytes of " + path_);
            // rewrite the valid prefix so future appends follow a good record
            std::ofstream nf(path_, std::ios::binary | std::ios::trunc);
            nf.write((const char*)data.data(), (std::streamsize)pos);
            if (!nf.good()){ err = "kv: cannot truncate " + path_; return false; }
        }
    }

    log_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!log_.good()){ err = "kv: open failed for " + path_; return false; }
    log_.seekp(0, std::ios::end);
    return true;
}

void LogKV::close(){
    std::lock_guard<std::mutex> lk(mu_);
    if (log_.is_open()) log_.close();
    live_.clear(); records_=0; bytes_=0;
}

bool LogKV::append_record(uint8_t op, const std::string& k, const std::string& v, std::string& err){
    if (!log_.is_open()){ err="kv: not open"; return false; }
    auto buf = encode_record(op, k, v);
    log_.write((const char*)buf.data(), (std::streamsize)buf.size());
    log_.flush();
    if (!log_.good()){ err="kv: write failed"; return false; }
    bytes_ += (uint64_t)buf.size();
    records_++;
    return true;
}

bool LogKV::get(const std::string& key, std::string& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(key);
    if (it == live_.end()) return false;
    out = it->second;
    return true;
}

bool LogKV::put(const std::string& key, const std::string& val, std::string& err){
    std::lock_guard<std::mutex> lk(mu_);
    if (!append_record(1, key, val, err)) return false;
    live_[key] = val;
    return true;
}

bool LogKV::del(const std::string& key, std::string& err){
    std::lock_guard<std::mutex> lk(mu_);
    if (live_.find(key) == live_.end()) return true;
    if (!append_record(0, key, "", err)) return false;
    live_.erase(key);
    return true;
}

void LogKV::scan(const Visitor& fn) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : live_) {
        if (!fn(kv.first, kv.second)) return;
    }
}

bool LogKV::compact(std::string& err){
    std::lock_guard<std::mutex> lk(mu_);
    std::string tmp = path_ + ".tmp";
    std::fstream nf(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!nf.good() || !write_header(nf)){ err="kv: compact open tmp failed"; return false; }

    uint64_t recs = 0, bytes = KV_HEADER;
    for (const auto& kv : live_) {
        auto buf = encode_record(1, kv.first, kv.second);
        nf.write((const char*)buf.data(), (std::streamsize)buf.size());
        if (!nf.good()){ err="kv: compact write failed"; nf.close(); std::remove(tmp.c_str()); return false; }
        recs++; bytes += (uint64_t)buf.size();
    }
    nf.flush();
    nf.close();

#ifdef _WIN32
    log_.close();
    std::remove(path_.c_str());
#endif
    if (std::rename(tmp.c_str(), path_.c_str()) != 0){
        err="kv: compact rename failed";
        std::remove(tmp.c_str());
#ifdef _WIN32
        log_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
        log_.seekp(0, std::ios::end);
#endif
        return false;
    }

    log_.close();
    log_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!log_.good()){ err="kv: reopen after compact failed"; return false; }
    log_.seekp(0, std::ios::end);
    records_ = recs;
    bytes_  = bytes;
    return true;
}

KV::Stats LogKV::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    Stats s;
    s.file_bytes = bytes_;
    s.log_records = records_;
    s.live_keys = live_.size();
    return s;
}

}
