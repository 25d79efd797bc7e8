#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "errors.h"
#include "tx.h"
#include "upload_types.h"
#include "wallet.h"

namespace mfs {

// Positions of the two funding outputs inside the paid merge transaction.
struct FundingOutputs {
    int chunk{-1};
    int index{-1};
};

// Finds the outputs paying `pay_script` whose amounts equal (first pass) or
// lie within MATCH_TOLERANCE of (second pass) the requested amounts. The
// chunk output is claimed before the index output and no output is claimed
// twice.
bool match_funding_outputs(const Transaction& tx, const std::vector<uint8_t>& pay_script,
                           uint64_t chunk_amount, uint64_t index_amount,
                           FundingOutputs& out, Error& e);

// DER signature check (strict structure, no sighash byte).
bool is_der_signature(const std::vector<uint8_t>& sig);
// Wallets return either bare DER or DER plus a sighash byte; the result is DER || sighash.
bool normalize_signature(const std::string& sig_hex, uint8_t sighash,
                         std::vector<uint8_t>& out, Error& e);

struct MergeResult {
    FinalTransaction tx;
    Utxo chunk_funding;
    Utxo index_funding;
};

// The three transactions handed to the backend.
struct ChainBundle {
    FinalTransaction merge;
    OpenTransaction chunk_pre;
    OpenTransaction index_pre;
};

class ChainBuilder {
public:
    // Fails with InvalidInput from each operation when address is not a P2PKH address.
    ChainBuilder(WalletProvider& wallet, std::string address, double fee_rate);

    bool build_merge(const UtxoSelection& sel, const FundingPlan& plan, MergeResult& out, Error& e);
    bool build_open_pre_tx(const Utxo& funding, OpenTransaction& out, Error& e);
    bool build_chain(const UtxoSelection& sel, const FundingPlan& plan, ChainBundle& out, Error& e);

    // Direct upload: collapses several Utxos into one paying `amount` to the caller.
    bool merge_to_single(const UtxoSelection& sel, uint64_t amount,
                         FinalTransaction& merge, Utxo& funding, Error& e);
    // One input, one 1-unit output to the caller, signed SINGLE|ANYONECANPAY|FORKID.
    bool build_direct_base(const Utxo& funding, OpenTransaction& out, Error& e);

private:
    WalletProvider& wallet_;
    std::string address_;
    double fee_rate_;
    std::vector<uint8_t> pay_script_;

    bool check_address(Error& e) const;
    bool pay(const PaymentCandidate& cand, FinalTransaction& out, Error& e);
    bool sign_single_input(Transaction& tx, const Utxo& funding, uint8_t sighash, Error& e);
};

Utxo utxo_from_output(const std::string& txid_hex, const Transaction& tx, uint32_t vout);

}
