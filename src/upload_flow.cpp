#include "upload_flow.h"
#include "fee_estimator.h"
#include "log.h"
#include "utxo_selector.h"
#include "util.h"

namespace mfs {

UploadFlow::UploadFlow(UploaderApi& api, WalletProvider& wallet, SessionStore& sessions,
                       FlowContext ctx, ProgressSink* sink)
    : api_(api), wallet_(wallet), sessions_(sessions), ctx_(std::move(ctx)), sink_(sink) {
    ctx_.fee_rate = effective_fee_rate(ctx_.fee_rate);
}

bool UploadFlow::select_funds(uint64_t required, UtxoSelection& sel, Error& e) {
    std::vector<Utxo> utxos;
    if (!wallet_.get_spendable_outputs(utxos, e)) return fail_ctx(e, "Failed to get UTXOs");
    if (!select_utxos(utxos, required, sel, e)) return fail_ctx(e, "Failed to get UTXOs");
    return true;
}

bool UploadFlow::finish(bool ok, const char* label, Error& e) {
    if (ok) return true;
    if (e.kind != ErrKind::UserCancelled && is_user_cancel_message(e.message)) e.kind = ErrKind::UserCancelled;
    if (e.kind == ErrKind::UserCancelled) log_warn(LogCategory::UPLOAD, std::string(label) + " cancelled");
    else log_error(LogCategory::UPLOAD, std::string(label) + " failed: " + e.message);
    return false;
}

bool UploadFlow::run_chunked(const FileDescriptor& file, FileSource& src, bool asynchronous,
                             ChunkedUploadOutcome& out, Error& e) {
    const char* label = asynchronous ? "Async chunked upload task" : "Chunked upload";
    log_info(LogCategory::UPLOAD, std::string("Starting ") + label + " of " + file.name +
             " (" + format_size(file.size) + ")");

    MultipartUploader uploader(api_, sessions_, sink_);
    if (!uploader.upload(file, src, ctx_.meta_id, ctx_.address, out.storage_key, e))
        return finish(false, label, e);

    const std::string path = metadata_path(ctx_.file_host);
    FeeEstimator estimator(api_);
    if (!estimator.estimate(file, out.storage_key, path, ctx_.fee_rate, out.estimate, e))
        return finish(false, label, e);

    out.plan = plan_funding(out.estimate, ctx_.fee_rate);
    if (confirm_ && !confirm_(file, out.estimate, out.plan)) {
        fail(e, ErrKind::UserCancelled, "user cancelled the upload");
        return finish(false, label, e);
    }

    UtxoSelection sel;
    if (!select_funds(out.plan.total_required, sel, e)) return finish(false, label, e);

    ChainBuilder builder(wallet_, ctx_.address, ctx_.fee_rate);
    ChainBundle chain;
    if (!builder.build_chain(sel, out.plan, chain, e)) return finish(false, label, e);
    out.merge_txid = chain.merge.txid_hex();

    ChunkedUploadRequest req;
    req.meta_id = ctx_.meta_id;
    req.address = ctx_.address;
    req.file_name = file.name;
    req.path = path;
    req.content_type = upload_content_type(file.mime_type);
    req.chunk_pre_tx_hex = chain.chunk_pre.hex();
    req.index_pre_tx_hex = chain.index_pre.hex();
    req.merge_tx_hex = chain.merge.hex();
    req.fee_rate = ctx_.fee_rate;
    req.storage_key = out.storage_key;

    if (asynchronous) {
        if (!api_.create_chunked_task(req, out.task, e)) return finish(false, label, e);
        log_info(LogCategory::TASK, "created task " + out.task.task_id + " for " + file.name);
        return true;
    }

    SyncUploadResult res;
    bool ok;
    {
        if (sink_) {
            ProgressEvent ev;
            ev.phase = ProgressPhase::Processing;
            ev.percent = ProgressEstimator::kStart;
            sink_->on_progress(ev);
        }
        ProgressTicker ticker(ProgressEstimator(out.estimate.chunk_number), sink_, tick_);
        ok = api_.chunked_upload_sync(req, res, e);
        ticker.stop();
    }
    if (!ok) return finish(false, label, e);
    if (to_lower(res.status) == "failed") {
        fail(e, ErrKind::RemoteRequestFailure,
             res.message.empty() ? "Upload failed with unknown error" : res.message);
        return finish(false, label, e);
    }
    out.tx_id = res.index_tx_id;
    out.pin_id = res.index_tx_id + "i0";
    if (sink_) {
        ProgressEvent ev;
        ev.phase = ProgressPhase::Processing;
        ev.percent = 100.0;
        sink_->on_progress(ev);
    }
    log_info(LogCategory::UPLOAD, "upload complete, pin " + out.pin_id);
    return true;
}

bool UploadFlow::run_direct(const FileDescriptor& file, FileSource& src, DirectUploadResult& out, Error& e) {
    const char* label = "Direct upload";
    if (file.size == 0 || src.size() != file.size) {
        fail(e, ErrKind::InvalidInput, "file is empty or changed since it was selected");
        return finish(false, label, e);
    }

    const std::string path = metadata_path(ctx_.file_host);
    const uint64_t fee = direct_upload_fee(file.size, path, ctx_.fee_rate);
    log_info(LogCategory::UPLOAD, "direct upload of " + file.name + ", estimated fee " + std::to_string(fee) + " sat");

    UtxoSelection sel;
    if (!select_funds(fee, sel, e)) return finish(false, label, e);

    ChainBuilder builder(wallet_, ctx_.address, ctx_.fee_rate);
    Utxo funding;
    std::string merge_hex;
    if (sel.selected.size() > 1) {
        FinalTransaction merge;
        if (!builder.merge_to_single(sel, fee, merge, funding, e)) return finish(false, label, e);
        merge_hex = merge.hex();
        log_info(LogCategory::TX, "merged " + std::to_string(sel.selected.size()) + " utxos in " + merge.txid_hex());
    } else {
        funding = sel.selected.front();
    }

    OpenTransaction base;
    if (!builder.build_direct_base(funding, base, e)) return finish(false, label, e);

    std::string content;
    std::string err;
    if (!src.read(0, (size_t)file.size, content, err)) {
        fail(e, ErrKind::InvalidInput, err);
        return finish(false, label, e);
    }

    DirectUploadRequest req;
    req.file_name = file.name;
    req.content_type = direct_content_type(file.mime_type);
    req.content = std::move(content);
    req.path = path;
    req.merge_tx_hex = merge_hex;
    req.pre_tx_hex = base.hex();
    req.meta_id = ctx_.meta_id;
    req.address = ctx_.address;
    req.change_address = ctx_.address;
    req.fee_rate = ctx_.fee_rate;
    req.total_input_amount = funding.satoshis;

    if (!api_.direct_upload(req, out, e)) return finish(false, label, e);
    log_info(LogCategory::UPLOAD, "direct upload complete: tx " + out.tx_id + ", pin " + out.pin_id);
    return true;
}

}
