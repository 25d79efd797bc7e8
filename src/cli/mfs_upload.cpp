// mfs-upload: command line front end for chunked and direct file uploads.
#include "address.h"
#include "api_client.h"
#include "config.h"
#include "constants.h"
#include "fee_estimator.h"
#include "http_client.h"
#include "kv_log.h"
#include "log.h"
#include "multipart_uploader.h"
#include "paths.h"
#include "session_store.h"
#include "task_tracker.h"
#include "upload_flow.h"
#include "util.h"
#include "wallet/rpc_wallet.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace mfs;

static void usage(){
    std::cout <<
R"(mfs-upload - commit files to chain-backed storage

Usage:
  mfs-upload [--conf FILE] [--KEY VALUE ...] <command> [args]
  (config keys: api_base file_host wallet_rpc wallet_token_file network fee_rate
   data_dir task_page_size http_timeout_ms log_level log_file metaid address)

Commands:
  upload <path> [--sync] [--yes]   Chunked upload; async task unless --sync
  direct <path>                    Single transaction upload (small files)
  estimate <path>                  Local layout and direct-upload fee
  tasks [--more]                   List upload tasks (--more follows all pages)
  session <path>                   Show resumable multipart state for a file

Examples:
  mfs-upload --address 1Abc... --metaid 5f... upload ./video.mp4
  mfs-upload tasks --more
)";
}

struct Args {
    std::string conf;
    std::vector<std::pair<std::string,std::string>> overrides;
    std::string cmd;
    std::vector<std::string> rest;
    bool sync = false;
    bool yes = false;
    bool more = false;
};

static Args parse_args(int argc, char** argv){
    Args a;
    for(int i=1;i<argc;i++){
        std::string s = argv[i];
        if(s=="-h" || s=="--help"){ usage(); std::exit(0); }
        else if(s=="--conf" && i+1<argc) a.conf = argv[++i];
        else if(s=="--sync") a.sync = true;
        else if(s=="--yes" || s=="-y") a.yes = true;
        else if(s=="--more") a.more = true;
        else if(s.rfind("--",0)==0 && i+1<argc) a.overrides.push_back({s.substr(2), argv[++i]});
        else if(s.rfind("--",0)==0) throw std::runtime_error("missing value for " + s);
        else if(a.cmd.empty()) a.cmd = s;
        else a.rest.push_back(s);
    }
    return a;
}

static std::string guess_mime(const std::string& path){
    static const std::map<std::string,std::string> types = {
        {"txt","text/plain"}, {"html","text/html"}, {"css","text/css"}, {"csv","text/csv"},
        {"json","application/json"}, {"js","application/javascript"}, {"xml","application/xml"},
        {"png","image/png"}, {"jpg","image/jpeg"}, {"jpeg","image/jpeg"}, {"gif","image/gif"},
        {"webp","image/webp"}, {"svg","image/svg+xml"}, {"mp4","video/mp4"}, {"webm","video/webm"},
        {"mp3","audio/mpeg"}, {"wav","audio/wav"}, {"pdf","application/pdf"}, {"zip","application/zip"},
    };
    auto dot = path.rfind('.');
    if(dot==std::string::npos) return "";
    auto it = types.find(to_lower(path.substr(dot+1)));
    return it==types.end() ? "" : it->second;
}

static std::string base_name(const std::string& path){
    auto p = path.find_last_of("/\\");
    return p==std::string::npos ? path : path.substr(p+1);
}

static bool open_file(const std::string& path, DiskFileSource& src, FileDescriptor& fd){
    std::string err;
    if(!src.open(path, err)){ std::cerr << "error: " << err << "\n"; return false; }
    fd.name = base_name(path);
    fd.size = src.size();
    fd.mime_type = guess_mime(path);
    return true;
}

class ConsoleProgress : public ProgressSink {
public:
    void on_progress(const ProgressEvent& ev) override {
        if(ev.phase==ProgressPhase::Uploading){
            std::fprintf(stderr, "\r  uploading part %d/%d  %s / %s  %s/s   ",
                         ev.current_part, ev.total_parts,
                         format_size(ev.uploaded_bytes).c_str(), format_size(ev.total_bytes).c_str(),
                         format_size((uint64_t)ev.bytes_per_sec).c_str());
        } else if(ev.phase==ProgressPhase::Completing){
            std::fprintf(stderr, "\r  completing upload...%40s\n", "");
        } else {
            std::fprintf(stderr, "\r  processing %3.0f%%   ", ev.percent);
            if(ev.percent>=100.0) std::fprintf(stderr, "\n");
        }
        std::fflush(stderr);
    }
};

static bool confirm_upload(const FileDescriptor& f, const FeeEstimate& est, const FundingPlan& plan){
    std::cout << "File:            " << f.name << " (" << format_size(f.size) << ")\n"
              << "Chunks:          " << est.chunk_number << " x " << format_size(est.chunk_size) << "\n"
              << "Chunk pre-tx:    " << est.chunk_pre_tx_fee << " sat\n"
              << "Index pre-tx:    " << est.index_pre_tx_fee << " sat\n"
              << "Backend total:   " << est.total_fee << " sat\n"
              << "Merge fee:       " << plan.merge_fee << " sat\n"
              << "Wallet spend:    " << plan.total_required << " sat\n"
              << "Proceed? [y/N] " << std::flush;
    std::string line;
    if(!std::getline(std::cin, line)) return false;
    line = to_lower(trim(line));
    return line=="y" || line=="yes";
}

static int report_error(const Error& e){
    if(e.kind==ErrKind::UserCancelled){ std::cerr << "cancelled\n"; return 2; }
    std::cerr << "error [" << err_kind_name(e.kind) << "]: " << e.message << "\n";
    return 1;
}

static bool require_identity(const Config& cfg){
    if(cfg.address.empty() || cfg.metaid.empty()){
        std::cerr << "error: address and metaid must be configured (--address, --metaid)\n";
        return false;
    }
    std::vector<uint8_t> pkh;
    Network net;
    if(!decode_p2pkh_address(cfg.address, pkh, &net)){
        std::cerr << "error: invalid address " << cfg.address << "\n";
        return false;
    }
    if(net != cfg.network){
        std::cerr << "error: address belongs to " << network_name(net) << ", configured network is "
                  << network_name(cfg.network) << "\n";
        return false;
    }
    return true;
}

struct Runtime {
    Config cfg;
    SocketHttpTransport http;
    UploaderApi api;
    LogKV kv;
    explicit Runtime(const Config& c)
        : cfg(c), http(c.http_timeout_ms), api(http, c.api_base) {}

    bool open_sessions(){
        std::string dir = cfg.data_dir.empty() ? default_data_dir() : cfg.data_dir;
        if(!ensure_dir(dir)){ std::cerr << "error: cannot create data dir " << dir << "\n"; return false; }
        std::string err;
        if(!kv.open(join_path(dir, "sessions.kv"), err)){ std::cerr << "error: " << err << "\n"; return false; }
        return true;
    }
};

static int cmd_upload(Runtime& rt, const Args& a){
    if(a.rest.empty()){ usage(); return 1; }
    if(!require_identity(rt.cfg) || !rt.open_sessions()) return 1;
    DiskFileSource src; FileDescriptor fd;
    if(!open_file(a.rest[0], src, fd)) return 1;

    SessionStore sessions(rt.kv);
    sessions.purge_expired();
    RpcWallet wallet(rt.http, rt.cfg.wallet_rpc);
    wallet.load_token(rt.cfg.wallet_token_file);

    ConsoleProgress progress;
    FlowContext ctx{rt.cfg.metaid, rt.cfg.address, rt.cfg.fee_rate, rt.cfg.file_host};
    UploadFlow flow(rt.api, wallet, sessions, ctx, &progress);
    if(!a.yes) flow.set_confirm(confirm_upload);

    ChunkedUploadOutcome out;
    Error e;
    if(!flow.run_chunked(fd, src, !a.sync, out, e)) return report_error(e);
    std::cout << "storage key: " << out.storage_key << "\n"
              << "merge tx:    " << out.merge_txid << "\n";
    if(a.sync) std::cout << "txid:        " << out.tx_id << "\npin:         " << out.pin_id << "\n";
    else std::cout << "task:        " << out.task.task_id << " (" << out.task.status << ")\n";
    return 0;
}

static int cmd_direct(Runtime& rt, const Args& a){
    if(a.rest.empty()){ usage(); return 1; }
    if(!require_identity(rt.cfg) || !rt.open_sessions()) return 1;
    DiskFileSource src; FileDescriptor fd;
    if(!open_file(a.rest[0], src, fd)) return 1;

    SessionStore sessions(rt.kv);
    RpcWallet wallet(rt.http, rt.cfg.wallet_rpc);
    wallet.load_token(rt.cfg.wallet_token_file);
    FlowContext ctx{rt.cfg.metaid, rt.cfg.address, rt.cfg.fee_rate, rt.cfg.file_host};
    UploadFlow flow(rt.api, wallet, sessions, ctx);

    DirectUploadResult out;
    Error e;
    if(!flow.run_direct(fd, src, out, e)) return report_error(e);
    std::cout << "txid: " << out.tx_id << "\npin:  " << out.pin_id << "\nstatus: " << out.status << "\n";
    return 0;
}

static int cmd_estimate(Runtime& rt, const Args& a){
    if(a.rest.empty()){ usage(); return 1; }
    DiskFileSource src; FileDescriptor fd;
    if(!open_file(a.rest[0], src, fd)) return 1;
    const FeeEstimate layout = local_layout(fd);
    const std::string path = metadata_path(rt.cfg.file_host);
    const double rate = effective_fee_rate(rt.cfg.fee_rate);
    std::cout << "file:         " << fd.name << " (" << format_size(fd.size) << ")\n"
              << "content type: " << upload_content_type(fd.mime_type) << "\n"
              << "chunks:       " << layout.chunk_number << " x " << format_size(layout.chunk_size) << "\n"
              << "pre-tx build: " << fee_for_size(dependent_tx_size(1), rate) << " sat each\n"
              << "merge fee:    " << fee_for_size(MERGE_TX_SIZE, rate) << " sat\n"
              << "direct fee:   " << direct_upload_fee(fd.size, path, rate) << " sat\n";
    return 0;
}

static int cmd_tasks(Runtime& rt, const Args& a){
    if(rt.cfg.address.empty()){ std::cerr << "error: address must be configured\n"; return 1; }
    TaskTracker tracker(rt.api, rt.cfg.address, rt.cfg.task_page_size);
    Error e;
    if(!tracker.load(e)) return report_error(e);
    while(a.more && tracker.state().has_more){
        if(!tracker.load_more(e)) return report_error(e);
    }
    const auto& st = tracker.state();
    if(st.tasks.empty()){ std::cout << "no tasks\n"; return 0; }
    for(const auto& t : st.tasks){
        std::printf("%-24s %-10s %3d%%  %lld/%lld  %s\n", t.task_id.c_str(),
                    task_status_name(classify_status(t.status)), display_progress(t),
                    (long long)t.processed_chunks, (long long)t.total_chunks,
                    t.file_name.c_str());
        if(!t.current_step.empty()) std::printf("    step:  %s\n", t.current_step.c_str());
        if(!t.index_tx_id.empty()) std::printf("    index: %s\n", t.index_tx_id.c_str());
        if(!t.error_message.empty()) std::printf("    error: %s\n", t.error_message.c_str());
    }
    if(st.has_more) std::cout << "(more tasks available, use --more)\n";
    return 0;
}

static int cmd_session(Runtime& rt, const Args& a){
    if(a.rest.empty()){ usage(); return 1; }
    if(!require_identity(rt.cfg) || !rt.open_sessions()) return 1;
    DiskFileSource src; FileDescriptor fd;
    if(!open_file(a.rest[0], src, fd)) return 1;
    SessionStore sessions(rt.kv);
    const std::string key = session_key(fd.name, fd.size, rt.cfg.metaid, rt.cfg.address);
    UploadSession s;
    if(!sessions.load(key, s)){ std::cout << "no resumable upload for " << fd.name << "\n"; return 0; }
    const int64_t age_min = (sessions.now() - s.timestamp_ms) / 60000;
    std::cout << "upload id: " << s.upload_id << "\nkey:       " << s.key
              << "\nage:       " << age_min << " min\n";
    MultipartUpload up{s.upload_id, s.key};
    std::vector<UploadPart> parts;
    Error e;
    if(rt.api.multipart_list_parts(up, parts, e)){
        std::cout << "committed: " << parts.size() << "/" << chunk_count(fd.size, CHUNK_SIZE) << " parts\n";
    } else {
        std::cout << "committed: unknown (" << e.message << ")\n";
    }
    return 0;
}

int main(int argc, char** argv){
    try{
        Args a = parse_args(argc, argv);
        if(a.cmd.empty()){ usage(); return 1; }

        Config cfg;
        if(!a.conf.empty() && !load_config(a.conf, cfg)){
            std::cerr << "error: cannot read config " << a.conf << "\n";
            return 1;
        }
        for(const auto& kv : a.overrides){
            if(!apply_config_value(kv.first, kv.second, cfg)){
                std::cerr << "error: bad option --" << kv.first << " " << kv.second << "\n";
                return 1;
            }
        }
        log_init(cfg.log_level, static_cast<uint32_t>(LogCategory::ALL), cfg.log_file);

        Runtime rt(cfg);
        int rc;
        if(a.cmd=="upload")        rc = cmd_upload(rt, a);
        else if(a.cmd=="direct")   rc = cmd_direct(rt, a);
        else if(a.cmd=="estimate") rc = cmd_estimate(rt, a);
        else if(a.cmd=="tasks")    rc = cmd_tasks(rt, a);
        else if(a.cmd=="session")  rc = cmd_session(rt, a);
        else {
            std::cerr << "unknown command: " << a.cmd << "\n";
            usage(); rc = 1;
        }
        log_shutdown();
        return rc;
    }catch(const std::exception& ex){
        std::cerr << "fatal: " << ex.what() << "\n"; return 1;
    }
}
