#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mfs {

struct FileDescriptor {
    std::string name;
    uint64_t    size{0};
    std::string mime_type;
};

// An unspent output owned by the wallet. script_hex is the locking script of
// the output being spent.
struct Utxo {
    std::string txid;      // display hex
    uint32_t    vout{0};
    std::string script_hex;
    uint64_t    satoshis{0};
};

struct UtxoSelection {
    std::vector<Utxo> selected;   // descending by value
    uint64_t total{0};
};

struct FeeEstimate {
    uint64_t chunk_size{0};
    uint64_t chunk_number{0};
    uint64_t chunk_pre_tx_fee{0};
    uint64_t index_pre_tx_fee{0};
    uint64_t per_chunk_fee{0};
    uint64_t total_fee{0};
};

// Amounts the merge transaction must produce for the two pre-transactions.
struct FundingPlan {
    uint64_t pre_tx_build_fee{0};
    uint64_t chunk_output{0};
    uint64_t index_output{0};
    uint64_t merge_fee{0};
    uint64_t total_required{0};
};

struct UploadPart {
    int         part_number{0};
    std::string etag;
    uint64_t    size{0};
};

enum class TaskStatus { Pending, Processing, Success, Failed };

struct UploadTask {
    std::string task_id;
    std::string status;            // as reported by the backend
    int         progress{0};
    int64_t     processed_chunks{0};
    int64_t     total_chunks{0};
    std::string current_step;
    std::string index_tx_id;
    std::string error_message;
    std::string file_name;
    std::string created_at;
};

}
