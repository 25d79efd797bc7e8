#include "wallet/rpc_wallet.h"
#include "hex.h"
#include "log.h"
#include "serialize.h"
#include "util.h"

#include <cstdlib>
#include <fstream>

namespace mfs {

static bool read_first_line_trim(const std::string& path, std::string& out){
    std::ifstream f(path);
    if(!f.good()) return false;
    std::getline(f, out);
    out = trim(out);
    return true;
}

bool RpcWallet::load_token(const std::string& cookie_path){
    if(const char* env = std::getenv("MFS_WALLET_TOKEN")){
        if(*env){ token_ = env; return true; }
    }
    if(cookie_path.empty()) return false;
    std::string t;
    if(!read_first_line_trim(cookie_path, t) || t.empty()) return false;
    token_ = t;
    return true;
}

static std::string rpc_error_text(const JNode& err){
    if(std::holds_alternative<std::string>(err.v)) return std::get<std::string>(err.v);
    if(json_is_obj(err)){
        std::string m = json_str(err, "message");
        if(!m.empty()) return m;
    }
    return json_dump(err);
}

bool RpcWallet::call(const std::string& method, JArr params, JNode& result, Error& e){
    JObj body;
    body["method"] = jstr(method);
    body["params"] = jarr(std::move(params));

    HttpRequest req;
    req.method = "POST";
    req.url = url_;
    req.body = json_dump(jobj(std::move(body)));
    req.headers.push_back({"Content-Type", "application/json"});
    if(!token_.empty()){
        req.headers.push_back({"Authorization", "Bearer " + token_});
        req.headers.push_back({"X-Auth-Token", token_});
    }

    HttpResponse resp;
    std::string err;
    if(!http_.send(req, resp, err)){
        return fail(e, ErrKind::DependencyUnavailable, "wallet unreachable: " + err);
    }

    JNode root;
    if(!json_parse(resp.body, root) || !json_is_obj(root)){
        return fail(e, ErrKind::DependencyUnavailable,
                    "wallet returned HTTP " + std::to_string(resp.code) + " with a malformed body");
    }
    const JNode* jerr = json_get(root, "error");
    if(jerr && !std::holds_alternative<JNull>(jerr->v)){
        std::string m = rpc_error_text(*jerr);
        if(is_user_cancel_message(m)) return fail(e, ErrKind::UserCancelled, m);
        return fail(e, ErrKind::DependencyUnavailable, m);
    }
    if(resp.code < 200 || resp.code >= 300){
        return fail(e, ErrKind::DependencyUnavailable, "wallet returned HTTP " + std::to_string(resp.code));
    }
    const JNode* r = json_get(root, "result");
    result = r ? *r : JNode{};
    MFS_LOG_TRACE(LogCategory::WALLET, "wallet rpc " + method + " ok");
    return true;
}

static Utxo parse_utxo(const JNode& n){
    Utxo u;
    u.txid = json_str(n, "txid", json_str(n, "txId"));
    u.vout = (uint32_t)json_int(n, "vout", json_int(n, "outputIndex"));
    u.script_hex = json_str(n, "script", json_str(n, "scriptPubKey"));
    u.satoshis = (uint64_t)json_int(n, "satoshis", json_int(n, "value"));
    if(u.script_hex.empty()){
        std::vector<uint8_t> script;
        if(p2pkh_script_for_address(json_str(n, "address"), script)) u.script_hex = to_hex(script);
    }
    return u;
}

static JNode utxo_json(const Utxo& u){
    JObj o;
    o["txId"] = jstr(u.txid);
    o["outputIndex"] = jnum(u.vout);
    o["script"] = jstr(u.script_hex);
    o["satoshis"] = jnum((double)u.satoshis);
    return jobj(std::move(o));
}

bool RpcWallet::get_spendable_outputs(std::vector<Utxo>& out, Error& e){
    JNode r;
    if(!call("getutxos", {}, r, e)) return false;
    out.clear();
    if(!json_is_arr(r)) return fail(e, ErrKind::DependencyUnavailable, "getutxos: result is not an array");
    for(const auto& n : std::get<JArr>(r.v)){
        Utxo u = parse_utxo(n);
        if(u.txid.empty()) continue;
        out.push_back(std::move(u));
    }
    return true;
}

bool RpcWallet::pay_and_sign(const PaymentCandidate& candidate, double fee_rate,
                             SignedPayment& out, Error& e){
    JArr inputs;
    for(const auto& u : candidate.inputs) inputs.push_back(utxo_json(u));
    JObj p;
    p["txHex"] = jstr(tx_to_hex(candidate.tx));
    p["inputs"] = jarr(std::move(inputs));
    p["feeRate"] = jnum(fee_rate);

    JNode r;
    if(!call("pay", {jobj(std::move(p))}, r, e)) return false;
    out.raw_hex = json_str(r, "txHex", json_str(r, "rawTx"));
    out.txid = json_str(r, "txid", json_str(r, "txId"));
    if(out.raw_hex.empty()) return fail(e, ErrKind::DependencyUnavailable, "pay: wallet returned no transaction");
    return true;
}

bool RpcWallet::sign_input(const std::string& tx_hex, uint32_t input_index,
                           const std::string& script_hex, uint64_t satoshis, uint8_t sighash,
                           InputSignature& out, Error& e){
    JObj p;
    p["txHex"] = jstr(tx_hex);
    p["inputIndex"] = jnum(input_index);
    p["script"] = jstr(script_hex);
    p["satoshis"] = jnum((double)satoshis);
    p["sigtype"] = jnum(sighash);

    JNode r;
    if(!call("signtransaction", {jobj(std::move(p))}, r, e)) return false;
    out.signature_hex = json_str(r, "sig", json_str(r, "signature"));
    out.public_key_hex = json_str(r, "publicKey", json_str(r, "pubkey"));
    return true;
}

}
