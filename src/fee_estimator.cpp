#include "fee_estimator.h"
#include "constants.h"
#include "log.h"
#include "util.h"

#include <cmath>

namespace mfs {

double effective_fee_rate(double rate) {
    if (!std::isfinite(rate) || rate <= 0.0) return 1.0;
    return rate;
}

uint64_t fee_for_size(uint64_t size_bytes, double rate) {
    return (uint64_t)std::ceil((double)size_bytes * effective_fee_rate(rate));
}

uint64_t chunk_count(uint64_t file_size, uint64_t chunk_size) {
    if (chunk_size == 0) return 0;
    return (file_size + chunk_size - 1) / chunk_size;
}

uint64_t dependent_tx_size(uint64_t input_count) {
    return TX_BASE_SIZE + TX_INPUT_SIZE * input_count;
}

FeeEstimate local_layout(const FileDescriptor& file) {
    FeeEstimate e;
    e.chunk_size = CHUNK_SIZE;
    e.chunk_number = chunk_count(file.size, CHUNK_SIZE);
    return e;
}

FundingPlan plan_funding(const FeeEstimate& est, double fee_rate) {
    FundingPlan p;
    p.pre_tx_build_fee = fee_for_size(dependent_tx_size(1), fee_rate);
    p.chunk_output = est.chunk_pre_tx_fee + p.pre_tx_build_fee;
    p.index_output = est.index_pre_tx_fee + p.pre_tx_build_fee;
    p.merge_fee = fee_for_size(MERGE_TX_SIZE, fee_rate);
    p.total_required = p.chunk_output + p.index_output + p.merge_fee;
    return p;
}

uint64_t direct_metadata_size(const std::string& path) {
    // "metaid" + operation + path + encryption + version + content type
    return 6 + 10 + (uint64_t)path.size() + 10 + 10 + 50;
}

uint64_t direct_upload_fee(uint64_t file_size, const std::string& path, double fee_rate) {
    const uint64_t size = TX_BASE_SIZE + TX_INPUT_SIZE + 2 * TX_OUTPUT_SIZE + DIRECT_OP_RETURN_SIZE +
                          direct_metadata_size(path) + file_size;
    const uint64_t base = fee_for_size(size, fee_rate);
    return (uint64_t)std::ceil((double)base * DIRECT_FEE_MARGIN);
}

bool FeeEstimator::estimate(const FileDescriptor& file, const std::string& storage_key,
                            const std::string& path, double fee_rate, FeeEstimate& out, Error& e) {
    EstimateRequest req;
    req.file_name = file.name;
    req.path = path;
    req.content_type = upload_content_type(file.mime_type);
    req.fee_rate = effective_fee_rate(fee_rate);
    req.storage_key = storage_key;

    if (!api_.estimate_chunked(req, out, e)) return false;

    const FeeEstimate local = local_layout(file);
    if (out.chunk_size == 0) out.chunk_size = local.chunk_size;
    if (out.chunk_number == 0) out.chunk_number = chunk_count(file.size, out.chunk_size);

    log_info(LogCategory::UPLOAD, "estimate: " + std::to_string(out.chunk_number) + " chunks of " +
             format_size(out.chunk_size) + ", total fee " + std::to_string(out.total_fee) + " sat");
    return true;
}

}
