#pragma once
#include <cstdint>
#include <cstddef>

// === HTTP ===
#ifndef MFS_HTTP_TIMEOUT_MS
#define MFS_HTTP_TIMEOUT_MS 60000
#endif
#ifndef MFS_HTTP_MAX_BODY
#define MFS_HTTP_MAX_BODY (64u * 1024u * 1024u)
#endif

namespace mfs {

static constexpr const char* APP_NAME = "mfs-uploader";
static constexpr const char* DEFAULT_API_BASE = "https://file.metaid.io/metafile-uploader";
static constexpr const char* DEFAULT_WALLET_RPC = "http://127.0.0.1:9834";

// === Upload layout ===
static constexpr uint64_t CHUNK_SIZE = 1024ULL * 1024ULL;     // 1 MiB, also the multipart part size
static constexpr int64_t  SESSION_TTL_MS = 7LL * 24 * 60 * 60 * 1000;
static constexpr int      DEFAULT_TASK_PAGE_SIZE = 10;

// === Transaction sizing (bytes) ===
static constexpr uint64_t TX_BASE_SIZE   = 200;
static constexpr uint64_t TX_INPUT_SIZE  = 150;
static constexpr uint64_t TX_OUTPUT_SIZE = 34;
static constexpr uint64_t MERGE_TX_SIZE  = TX_BASE_SIZE + 2 * TX_INPUT_SIZE + 2 * TX_OUTPUT_SIZE; // 568
static constexpr uint64_t PRE_TX_SIZE    = TX_BASE_SIZE + TX_INPUT_SIZE;                          // 350
static constexpr uint64_t DIRECT_OP_RETURN_SIZE = 50;
static constexpr double   DIRECT_FEE_MARGIN = 1.2;

// === Funding ===
static constexpr uint64_t DUST_LIMIT = 600;          // outputs at or below are never selected
static constexpr uint64_t MATCH_TOLERANCE = 1000;    // merge output amount slack
static constexpr uint32_t TX_VERSION = 10;

// === Signature hash flags ===
static constexpr uint8_t SIGHASH_ALL          = 0x01;
static constexpr uint8_t SIGHASH_NONE         = 0x02;
static constexpr uint8_t SIGHASH_SINGLE       = 0x03;
static constexpr uint8_t SIGHASH_FORKID       = 0x40;
static constexpr uint8_t SIGHASH_ANYONECANPAY = 0x80;
// Pre-transactions commit to their own input only.
static constexpr uint8_t SIGHASH_OPEN   = SIGHASH_NONE | SIGHASH_ANYONECANPAY | SIGHASH_FORKID;
static constexpr uint8_t SIGHASH_DIRECT = SIGHASH_SINGLE | SIGHASH_ANYONECANPAY | SIGHASH_FORKID;

// === Addresses ===
static constexpr uint8_t VERSION_P2PKH_LIVENET = 0x00;
static constexpr uint8_t VERSION_P2PKH_TESTNET = 0x6f;

// === Backend endpoints (relative to api_base) ===
static constexpr const char* EP_ESTIMATE        = "/api/v1/files/estimate-chunked-upload";
static constexpr const char* EP_CHUNKED_TASK    = "/api/v1/files/chunked-upload-task";
static constexpr const char* EP_CHUNKED_SYNC    = "/api/v1/files/chunked-upload";
static constexpr const char* EP_TASKS           = "/api/v1/files/tasks";
static constexpr const char* EP_MP_INITIATE     = "/api/v1/files/multipart/initiate";
static constexpr const char* EP_MP_LIST_PARTS   = "/api/v1/files/multipart/list-parts";
static constexpr const char* EP_MP_UPLOAD_PART  = "/api/v1/files/multipart/upload-part";
static constexpr const char* EP_MP_COMPLETE     = "/api/v1/files/multipart/complete";
static constexpr const char* EP_DIRECT          = "/api/v1/files/direct-upload";

}
