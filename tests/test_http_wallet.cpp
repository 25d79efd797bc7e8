// URL and response parsing, backend envelope handling and the JSON-RPC wallet.
#include "test_support.h"
#include "api_client.h"
#include "wallet/rpc_wallet.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace mfs;

static int test_parsing() {
    Url u;
    std::string err;
    TEST_CHECK(parse_url("https://file.example.io/api/x?y=1#frag", u, err), "https url");
    TEST_CHECK(u.scheme == "https" && u.host == "file.example.io" && u.port == 443, "defaults");
    TEST_CHECK(u.path == "/api/x?y=1", "path keeps query, drops fragment");
    TEST_CHECK(parse_url("http://127.0.0.1:9834", u, err) && u.port == 9834 && u.path == "/", "port and root");
    TEST_CHECK(parse_url("http://[::1]:8080/rpc", u, err) && u.host == "::1" && u.port == 8080, "ipv6");
    TEST_CHECK(!parse_url("ftp://x", u, err), "scheme refused");
    TEST_CHECK(!parse_url("http://host:99999/", u, err), "port range");
    TEST_CHECK(!parse_url("nourl", u, err), "no scheme");

    HttpResponse r;
    TEST_CHECK(parse_http_response("HTTP/1.1 200 OK\r\nContent-Length: 2\r\nX-A:  b \r\n\r\nhiEXTRA", r, err), "content length");
    TEST_CHECK(r.code == 200 && r.body == "hi" && r.headers["x-a"] == "b", "body cut, headers lowercased");
    TEST_CHECK(parse_http_response("HTTP/1.1 201 Created\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki\r\n5;x=1\r\npedia\r\n0\r\n\r\n", r, err),
               "chunked");
    TEST_CHECK(r.code == 201 && r.body == "Wikipedia", "chunks joined");
    TEST_CHECK(parse_http_response("HTTP/1.0 404 Not Found\r\n\r\ngone", r, err) && r.body == "gone", "read to close");
    TEST_CHECK(!parse_http_response("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort", r, err), "truncated");
    TEST_CHECK(!parse_http_response("garbage", r, err), "not http");
    TEST_PASS("http parsing");
    return 0;
}

static int test_envelope() {
    mfstest::FakeTransport http;
    http.on("POST", EP_MP_INITIATE, [](const HttpRequest&, const JNode&, HttpResponse& r){
        r.body = "{\"code\":0,\"data\":{\"uploadId\":\"u\"}}";
    });
    http.on("POST", EP_CHUNKED_TASK, [](const HttpRequest&, const JNode&, HttpResponse& r){
        r.body = "{\"code\":0,\"data\":{\"taskId\":\"bare\",\"status\":\"processing\",\"progress\":30}}";
    });
    UploaderApi api(http, mfstest::kApiBase);
    MultipartUpload up;
    Error e;
    TEST_CHECK(!api.multipart_initiate("a", 1, "m", "addr", up, e), "missing key refused");
    TEST_CHECK(e.kind == ErrKind::RemoteRequestFailure, "remote failure");

    UploadTask t;
    TEST_CHECK(api.create_chunked_task(ChunkedUploadRequest{}, t, e), "bare task accepted");
    TEST_CHECK(t.task_id == "bare" && t.progress == 30, "task parsed");

    http.on("POST", EP_CHUNKED_TASK, [](const HttpRequest&, const JNode&, HttpResponse& r){
        r.body = "{\"code\":0,\"data\":{}}";
    });
    TEST_CHECK(!api.create_chunked_task(ChunkedUploadRequest{}, t, e), "task without id refused");

    http.on("POST", EP_CHUNKED_TASK, [](const HttpRequest&, const JNode&, HttpResponse& r){
        r.body = "<html>oops</html>";
    });
    TEST_CHECK(!api.create_chunked_task(ChunkedUploadRequest{}, t, e), "non-json refused");
    TEST_CHECK(e.message.find("Chunked upload task failed") == 0, "context");

    bool json_header = false;
    for (const auto& h : http.requests.front().headers) {
        if (h.first == "Content-Type" && h.second == "application/json") json_header = true;
    }
    TEST_CHECK(json_header, "json content type");
    TEST_PASS("backend envelope");
    return 0;
}

static int test_wallet() {
    mfstest::FakeTransport http;
    std::vector<JNode> calls;
    JNode next_result;
    std::string next_error;
    http.on("POST", "/rpc", [&](const HttpRequest&, const JNode& b, HttpResponse& r){
        calls.push_back(b);
        JObj o;
        if (!next_error.empty()) o["error"] = jobj({{"code", jnum(-1)}, {"message", jstr(next_error)}});
        else { o["result"] = next_result; o["error"] = JNode{}; }
        r.body = json_dump(jobj(o));
    });

    RpcWallet w(http, std::string(mfstest::kApiBase) + "/rpc", "tok");
    Error e;

    JObj a;
    a["txId"] = jstr(std::string(64, 'a'));
    a["outputIndex"] = jnum(2);
    a["value"] = jnum(5000);
    a["address"] = jstr(mfstest::kAddress);
    JObj b;
    b["txid"] = jstr(std::string(64, 'b'));
    b["vout"] = jnum(0);
    b["script"] = jstr("76a914" + std::string(40, '0') + "88ac");
    b["satoshis"] = jnum(700);
    next_result = jarr({jobj(a), jobj(b), jobj(JObj{})});
    std::vector<Utxo> utxos;
    TEST_CHECK(w.get_spendable_outputs(utxos, e), "getutxos");
    TEST_CHECK(utxos.size() == 2, "entry without txid skipped");
    TEST_CHECK(utxos[0].vout == 2 && utxos[0].satoshis == 5000, "alternate field names");
    TEST_CHECK(utxos[0].script_hex == std::string("76a914") + mfstest::kPkhHex + "88ac", "script from address");
    TEST_CHECK(json_str(calls[0], "method") == "getutxos", "method name");
    bool bearer = false;
    for (const auto& h : http.requests.back().headers) if (h.first == "Authorization" && h.second == "Bearer tok") bearer = true;
    TEST_CHECK(bearer, "bearer token sent");

    PaymentCandidate cand;
    cand.tx.vout.push_back(TxOut{1000, p2pkh_script(from_hex(mfstest::kPkhHex))});
    cand.inputs.push_back(utxos[0]);
    next_result = jobj({{"rawTx", jstr("0a000000")}, {"txId", jstr("cd")}});
    SignedPayment paid;
    TEST_CHECK(w.pay_and_sign(cand, 0.5, paid, e), "pay");
    TEST_CHECK(paid.raw_hex == "0a000000" && paid.txid == "cd", "alternate result names");
    const JNode& p = std::get<JArr>(json_get(calls[1], "params")->v)[0];
    TEST_CHECK(json_str(p, "txHex") == tx_to_hex(cand.tx) && json_num(p, "feeRate") == 0.5, "pay params");

    next_result = jobj({{"sig", jstr("3006020101020101")}, {"publicKey", jstr("02ab")}});
    InputSignature sig;
    TEST_CHECK(w.sign_input("00", 0, "76", 1000, 0xC2, sig, e), "sign");
    const JNode& sp = std::get<JArr>(json_get(calls[2], "params")->v)[0];
    TEST_CHECK(json_int(sp, "sigtype") == 0xC2 && json_int(sp, "satoshis") == 1000, "sign params");
    TEST_CHECK(sig.signature_hex == "3006020101020101" && sig.public_key_hex == "02ab", "sign result");

    next_error = "User canceled the request";
    TEST_CHECK(!w.sign_input("00", 0, "76", 1000, 0xC2, sig, e), "cancelled");
    TEST_CHECK(e.kind == ErrKind::UserCancelled, "cancel kind");
    next_error = "wallet locked";
    TEST_CHECK(!w.get_spendable_outputs(utxos, e) && e.kind == ErrKind::DependencyUnavailable, "other errors");

    http.fail_transport = true;
    TEST_CHECK(!w.get_spendable_outputs(utxos, e) && e.kind == ErrKind::DependencyUnavailable, "unreachable");
    TEST_CHECK(e.message.find("wallet unreachable") == 0, "unreachable message");

    const std::string cookie = "mfs_test_wallet.cookie";
    { std::ofstream f(cookie); f << "  secret-token \nsecond line\n"; }
    ::unsetenv("MFS_WALLET_TOKEN");
    RpcWallet w2(http, "http://x/rpc");
    TEST_CHECK(w2.load_token(cookie), "cookie token");
    TEST_CHECK(!w2.load_token("no-such-cookie"), "missing cookie");
    std::remove(cookie.c_str());
    TEST_PASS("rpc wallet");
    return 0;
}

int main() {
    log_init(LogLevel::FATAL);
    if (test_parsing()) return 1;
    if (test_envelope()) return 1;
    if (test_wallet()) return 1;
    std::printf("All http and wallet tests passed!\n");
    return 0;
}
