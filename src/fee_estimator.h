#pragma once
#include <cstdint>
#include <string>

#include "api_client.h"
#include "errors.h"
#include "upload_types.h"

namespace mfs {

// Rate actually used for fees: a zero, negative or non-finite rate means 1.
double effective_fee_rate(double rate);
// ceil(size x rate)
uint64_t fee_for_size(uint64_t size_bytes, double rate);

uint64_t chunk_count(uint64_t file_size, uint64_t chunk_size);
// 200 + 150 per input; outputs appended later by the backend are not counted
uint64_t dependent_tx_size(uint64_t input_count);

// Chunk size and count only; fee fields stay zero.
FeeEstimate local_layout(const FileDescriptor& file);

FundingPlan plan_funding(const FeeEstimate& est, double fee_rate);

// Single-transaction upload: base + input + 2 outputs + op_return + metadata + payload, plus 20%.
uint64_t direct_metadata_size(const std::string& path);
uint64_t direct_upload_fee(uint64_t file_size, const std::string& path, double fee_rate);

class FeeEstimator {
public:
    explicit FeeEstimator(UploaderApi& api) : api_(api) {}

    // Asks the backend for the chunk fees of an already uploaded file.
    bool estimate(const FileDescriptor& file, const std::string& storage_key,
                  const std::string& path, double fee_rate, FeeEstimate& out, Error& e);

private:
    UploaderApi& api_;
};

}
