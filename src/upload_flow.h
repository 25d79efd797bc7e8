#pragma once
#include <chrono>
#include <functional>
#include <string>

#include "api_client.h"
#include "chain_builder.h"
#include "errors.h"
#include "multipart_uploader.h"
#include "progress.h"
#include "session_store.h"
#include "upload_types.h"
#include "wallet.h"

namespace mfs {

struct FlowContext {
    std::string meta_id;
    std::string address;
    double      fee_rate{1.0};
    std::string file_host;
};

struct ChunkedUploadOutcome {
    std::string storage_key;
    FeeEstimate estimate;
    FundingPlan plan;
    std::string merge_txid;
    UploadTask  task;        // asynchronous mode
    std::string tx_id;       // synchronous mode
    std::string pin_id;
};

// Asked once the fee is known; returning false cancels the upload.
using ConfirmFn = std::function<bool(const FileDescriptor&, const FeeEstimate&, const FundingPlan&)>;

class UploadFlow {
public:
    UploadFlow(UploaderApi& api, WalletProvider& wallet, SessionStore& sessions,
               FlowContext ctx, ProgressSink* sink = nullptr);

    void set_confirm(ConfirmFn fn) { confirm_ = std::move(fn); }
    void set_tick_interval(std::chrono::milliseconds ms) { tick_ = ms; }

    // Storage upload, fee estimate, funding chain, then either a backend task
    // (asynchronous) or a blocking chunked upload that returns the pin.
    bool run_chunked(const FileDescriptor& file, FileSource& src, bool asynchronous,
                     ChunkedUploadOutcome& out, Error& e);

    // Single transaction upload of a small file.
    bool run_direct(const FileDescriptor& file, FileSource& src, DirectUploadResult& out, Error& e);

private:
    UploaderApi& api_;
    WalletProvider& wallet_;
    SessionStore& sessions_;
    FlowContext ctx_;
    ProgressSink* sink_;
    ConfirmFn confirm_;
    std::chrono::milliseconds tick_{1000};

    bool select_funds(uint64_t required, UtxoSelection& sel, Error& e);
    bool finish(bool ok, const char* label, Error& e);
};

}
