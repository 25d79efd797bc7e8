// Shared fixtures for the uploader tests: a scripted HTTP transport and an
// in-process wallet.
#pragma once
#include "constants.h"
#include "hash.h"
#include "http_client.h"
#include "hex.h"
#include "json.h"
#include "kv.h"
#include "log.h"
#include "serialize.h"
#include "tx.h"
#include "wallet.h"

#include <cstdio>
#include <functional>
#include <map>
#include <string>
#include <vector>

#define TEST_CHECK(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while(0)

#define TEST_PASS(name) std::printf("[PASS] %s\n", name)

namespace mfstest {

// P2PKH address of the compressed generator point (hash160 751e76e8...).
static const char* kAddress = "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH";
static const char* kPkhHex  = "751e76e8199196d454941c45d1b3a323f1433bd6";
static const char* kMetaId  = "metaid-test";
static const char* kApiBase = "http://api.test";

inline std::string ok_body(const mfs::JNode& data) {
    mfs::JObj o;
    o["code"] = mfs::jnum(0);
    o["message"] = mfs::jstr("success");
    o["data"] = data;
    return mfs::json_dump(mfs::jobj(std::move(o)));
}

inline std::string err_body(int code, const std::string& msg) {
    mfs::JObj o;
    o["code"] = mfs::jnum(code);
    o["message"] = mfs::jstr(msg);
    return mfs::json_dump(mfs::jobj(std::move(o)));
}

// Routes requests by "METHOD /path" (query string stripped) to handlers and
// records everything it was sent.
class FakeTransport : public mfs::HttpTransport {
public:
    using Handler = std::function<void(const mfs::HttpRequest&, const mfs::JNode& body, mfs::HttpResponse&)>;

    void on(const std::string& method, const std::string& path, Handler h) {
        routes_[method + " " + path] = std::move(h);
    }

    bool send(const mfs::HttpRequest& req, mfs::HttpResponse& out, std::string& err) override {
        requests.push_back(req);
        if (fail_transport) { err = "connection refused"; return false; }
        std::string path = req.url.substr(std::string(kApiBase).size());
        auto q = path.find('?');
        if (q != std::string::npos) path = path.substr(0, q);
        auto it = routes_.find(req.method + " " + path);
        if (it == routes_.end()) {
            out.code = 404;
            out.body = err_body(404, "no route " + path);
            return true;
        }
        mfs::JNode body;
        if (!req.body.empty() && !mfs::json_parse(req.body, body)) body = mfs::JNode{};
        out.code = 200;
        it->second(req, body, out);
        return true;
    }

    size_t count(const std::string& method, const std::string& path) const {
        size_t n = 0;
        for (const auto& r : requests) {
            std::string p = r.url.substr(std::string(kApiBase).size());
            auto q = p.find('?');
            if (q != std::string::npos) p = p.substr(0, q);
            if (r.method == method && p == path) ++n;
        }
        return n;
    }

    std::vector<mfs::HttpRequest> requests;
    bool fail_transport{false};

private:
    std::map<std::string, Handler> routes_;
};

// Signs nothing for real: pays candidates as-is (optionally adding a change
// output in front and nudging amounts) and returns a fixed DER signature.
class FakeWallet : public mfs::WalletProvider {
public:
    std::vector<mfs::Utxo> utxos;
    bool add_change{true};
    int64_t amount_nudge{0};          // added to every output paying us
    bool report_txid{true};
    bool bare_der{false};
    std::string pay_error;            // non-empty: pay_and_sign fails with it
    std::string sign_error;

    std::vector<mfs::PaymentCandidate> payments;
    std::vector<uint8_t> sighashes;
    std::vector<std::string> paid_txids;

    bool get_spendable_outputs(std::vector<mfs::Utxo>& out, mfs::Error& e) override {
        (void)e;
        out = utxos;
        return true;
    }

    bool pay_and_sign(const mfs::PaymentCandidate& cand, double fee_rate,
                      mfs::SignedPayment& out, mfs::Error& e) override {
        (void)fee_rate;
        if (!pay_error.empty()) {
            return mfs::fail(e, mfs::ErrKind::DependencyUnavailable, pay_error);
        }
        payments.push_back(cand);
        mfs::Transaction tx = cand.tx;
        for (auto& in : tx.vin) in.script_sig = std::vector<uint8_t>(107, 0x51);
        for (auto& o : tx.vout) o.value = (uint64_t)((int64_t)o.value + amount_nudge);
        if (add_change) {
            mfs::TxOut change;
            change.value = 12345;
            change.script_pubkey = mfs::p2pkh_script(std::vector<uint8_t>(20, 0x99));
            tx.vout.insert(tx.vout.begin(), change);
        }
        out.raw_hex = mfs::tx_to_hex(tx);
        if (report_txid) {
            out.txid = std::string(62, 'a') + (payments.size() < 10 ? "0" : "") + std::to_string(payments.size());
        }
        paid_txids.push_back(out.txid.empty() ? tx.txid_hex() : out.txid);
        return true;
    }

    bool sign_input(const std::string& tx_hex, uint32_t input_index,
                    const std::string& script_hex, uint64_t satoshis, uint8_t sighash,
                    mfs::InputSignature& out, mfs::Error& e) override {
        (void)tx_hex; (void)input_index; (void)script_hex; (void)satoshis;
        if (!sign_error.empty()) {
            return mfs::fail(e, mfs::ErrKind::DependencyUnavailable, sign_error);
        }
        sighashes.push_back(sighash);
        out.signature_hex = bare_der ? "3006020101020101" : "300602010102010141";
        out.public_key_hex = "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
        return true;
    }
};

// Session storage without a file behind it.
class MemKV : public mfs::KV {
public:
    bool open(const std::string&, std::string&) override { return true; }
    void close() override {}
    bool get(const std::string& key, std::string& out) const override {
        auto it = map.find(key);
        if (it == map.end()) return false;
        out = it->second;
        return true;
    }
    bool put(const std::string& key, const std::string& val, std::string&) override {
        map[key] = val;
        ++records;
        return true;
    }
    bool del(const std::string& key, std::string&) override {
        if (map.erase(key)) ++records;
        return true;
    }
    void scan(const Visitor& fn) const override {
        for (const auto& kv : map) if (!fn(kv.first, kv.second)) return;
    }
    bool compact(std::string&) override { records = map.size(); return true; }
    Stats stats() const override {
        Stats s;
        s.live_keys = map.size();
        s.log_records = records;
        return s;
    }

    std::map<std::string, std::string> map;
    uint64_t records{0};
};

inline mfs::Utxo make_utxo(char fill, uint32_t vout, uint64_t sats) {
    mfs::Utxo u;
    u.txid = std::string(64, fill);
    u.vout = vout;
    u.script_hex = std::string("76a914") + kPkhHex + "88ac";
    u.satoshis = sats;
    return u;
}

// Object storage side of the backend: multipart initiate / list / upload / complete.
struct StorageBackend {
    std::string upload_id{"u1"};
    std::string key{"k1"};
    std::string complete_key;                    // empty: complete answers without a key
    std::map<int, std::string> parts;            // part number -> decoded bytes
    std::vector<int> uploaded_order;
    bool list_fails{false};
    int fail_part{0};                            // part number to reject
    int initiated{0};
    int completed{0};
    std::vector<int> completed_parts;

    void install(FakeTransport& http) {
        http.on("POST", mfs::EP_MP_INITIATE, [this](const mfs::HttpRequest&, const mfs::JNode&, mfs::HttpResponse& r){
            ++initiated;
            mfs::JObj d;
            d["uploadId"] = mfs::jstr(upload_id);
            d["key"] = mfs::jstr(key);
            r.body = ok_body(mfs::jobj(d));
        });
        http.on("POST", mfs::EP_MP_LIST_PARTS, [this](const mfs::HttpRequest&, const mfs::JNode& b, mfs::HttpResponse& r){
            if (list_fails || mfs::json_str(b, "uploadId") != upload_id) {
                r.code = 404;
                r.body = err_body(404, "NoSuchUpload");
                return;
            }
            mfs::JArr arr;
            for (const auto& p : parts) {
                mfs::JObj o;
                o["partNumber"] = mfs::jnum(p.first);
                o["etag"] = mfs::jstr("etag-" + std::to_string(p.first));
                o["size"] = mfs::jnum((double)p.second.size());
                arr.push_back(mfs::jobj(o));
            }
            mfs::JObj d;
            d["parts"] = mfs::jarr(arr);
            r.body = ok_body(mfs::jobj(d));
        });
        http.on("POST", mfs::EP_MP_UPLOAD_PART, [this](const mfs::HttpRequest&, const mfs::JNode& b, mfs::HttpResponse& r){
            const int n = (int)mfs::json_int(b, "partNumber");
            if (n == fail_part) {
                r.code = 500;
                r.body = err_body(500, "storage unavailable");
                return;
            }
            std::vector<uint8_t> bytes;
            if (!mfs::base64_decode(mfs::json_str(b, "content"), bytes)) {
                r.body = err_body(400, "bad base64");
                return;
            }
            parts[n] = std::string(bytes.begin(), bytes.end());
            uploaded_order.push_back(n);
            mfs::JObj d;
            d["etag"] = mfs::jstr("etag-" + std::to_string(n));
            r.body = ok_body(mfs::jobj(d));
        });
        http.on("POST", mfs::EP_MP_COMPLETE, [this](const mfs::HttpRequest&, const mfs::JNode& b, mfs::HttpResponse& r){
            ++completed;
            completed_parts.clear();
            if (const mfs::JNode* arr = mfs::json_get(b, "parts")) {
                for (const auto& p : std::get<mfs::JArr>(arr->v)) {
                    completed_parts.push_back((int)mfs::json_int(p, "partNumber"));
                }
            }
            mfs::JObj d;
            if (!complete_key.empty()) d["key"] = mfs::jstr(complete_key);
            r.body = ok_body(mfs::jobj(d));
        });
    }

    std::string assembled() const {
        std::string all;
        for (const auto& p : parts) all += p.second;
        return all;
    }
};

inline std::string pattern_bytes(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = (char)((i * 31 + 7) & 0xff);
    return s;
}

}
