#include "chain_builder.h"
#include "constants.h"
#include "hex.h"
#include "log.h"
#include "serialize.h"

#include <utility>

namespace mfs {

static uint64_t abs_diff(uint64_t a, uint64_t b) { return a > b ? a - b : b - a; }

bool match_funding_outputs(const Transaction& tx, const std::vector<uint8_t>& pay_script,
                           uint64_t chunk_amount, uint64_t index_amount,
                           FundingOutputs& out, Error& e) {
    out = FundingOutputs{};
    std::vector<int> mine;
    for (size_t i = 0; i < tx.vout.size(); ++i) {
        if (tx.vout[i].script_pubkey == pay_script) mine.push_back((int)i);
    }

    // exact amounts
    for (int i : mine) {
        const uint64_t v = tx.vout[(size_t)i].value;
        if (out.chunk < 0 && v == chunk_amount) out.chunk = i;
        else if (out.index < 0 && v == index_amount) out.index = i;
    }
    // tolerance, output order
    for (int i : mine) {
        if (i == out.chunk || i == out.index) continue;
        const uint64_t v = tx.vout[(size_t)i].value;
        if (out.chunk < 0 && abs_diff(v, chunk_amount) <= MATCH_TOLERANCE) out.chunk = i;
        else if (out.index < 0 && abs_diff(v, index_amount) <= MATCH_TOLERANCE) out.index = i;
    }

    if (out.chunk < 0) {
        return fail(e, ErrKind::OutputMatchFailure,
                    "chunk funding output of " + std::to_string(chunk_amount) + " sat not found in merge transaction");
    }
    if (out.index < 0) {
        return fail(e, ErrKind::OutputMatchFailure,
                    "index funding output of " + std::to_string(index_amount) + " sat not found in merge transaction");
    }
    return true;
}

bool is_der_signature(const std::vector<uint8_t>& s) {
    // 0x30 len 0x02 rlen r 0x02 slen s
    if (s.size() < 8 || s.size() > 72) return false;
    if (s[0] != 0x30 || s[1] != s.size() - 2) return false;
    const size_t rlen = s[3];
    if (s[2] != 0x02 || rlen == 0 || 5 + rlen >= s.size()) return false;
    const size_t slen = s[5 + rlen];
    if (s[4 + rlen] != 0x02 || slen == 0) return false;
    if (rlen + slen + 6 != s.size()) return false;
    if (s[4] & 0x80) return false;
    if (rlen > 1 && s[4] == 0 && !(s[5] & 0x80)) return false;
    if (s[6 + rlen] & 0x80) return false;
    if (slen > 1 && s[6 + rlen] == 0 && !(s[7 + rlen] & 0x80)) return false;
    return true;
}

bool normalize_signature(const std::string& sig_hex, uint8_t sighash,
                         std::vector<uint8_t>& out, Error& e) {
    std::vector<uint8_t> sig = from_hex(sig_hex);
    if (sig.empty()) return fail(e, ErrKind::DependencyUnavailable, "wallet returned no signature");
    if (!is_der_signature(sig)) {
        sig.pop_back();
        if (!is_der_signature(sig)) {
            return fail(e, ErrKind::DependencyUnavailable, "wallet returned a malformed signature");
        }
    }
    sig.push_back(sighash);
    out.swap(sig);
    return true;
}

Utxo utxo_from_output(const std::string& txid_hex, const Transaction& tx, uint32_t vout) {
    Utxo u;
    u.txid = txid_hex;
    u.vout = vout;
    if (vout < tx.vout.size()) {
        u.script_hex = to_hex(tx.vout[vout].script_pubkey);
        u.satoshis = tx.vout[vout].value;
    }
    return u;
}

static bool outpoint_for(const Utxo& u, TxIn& in, Error& e) {
    in.prev.txid = txid_from_hex(u.txid);
    if (in.prev.txid.empty()) return fail(e, ErrKind::InvalidInput, "bad utxo txid '" + u.txid + "'");
    in.prev.vout = u.vout;
    return true;
}

ChainBuilder::ChainBuilder(WalletProvider& wallet, std::string address, double fee_rate)
    : wallet_(wallet), address_(std::move(address)), fee_rate_(fee_rate) {
    if (!p2pkh_script_for_address(address_, pay_script_)) pay_script_.clear();
}

bool ChainBuilder::check_address(Error& e) const {
    if (pay_script_.empty()) return fail(e, ErrKind::InvalidInput, "invalid address '" + address_ + "'");
    return true;
}

bool ChainBuilder::pay(const PaymentCandidate& cand, FinalTransaction& out, Error& e) {
    SignedPayment paid;
    if (!wallet_.pay_and_sign(cand, fee_rate_, paid, e)) return false;

    Transaction tx;
    if (!tx_from_hex(paid.raw_hex, tx)) {
        return fail(e, ErrKind::InvalidInput, "wallet returned an undecodable transaction");
    }
    // wallet-reported txid wins over the local dsha256
    std::string txid = paid.txid;
    if (txid.empty()) txid = tx.txid_hex();
    out = FinalTransaction(std::move(tx), txid);
    return true;
}

bool ChainBuilder::build_merge(const UtxoSelection& sel, const FundingPlan& plan, MergeResult& out, Error& e) {
    if (!check_address(e)) return fail_ctx(e, "Failed to build merge transaction");

    PaymentCandidate cand;
    cand.tx.version = TX_VERSION;
    for (const auto& u : sel.selected) {
        TxIn in;
        if (!outpoint_for(u, in, e)) return fail_ctx(e, "Failed to build merge transaction");
        cand.tx.vin.push_back(std::move(in));
        cand.inputs.push_back(u);
    }
    cand.tx.vout.push_back(TxOut{plan.chunk_output, pay_script_});
    cand.tx.vout.push_back(TxOut{plan.index_output, pay_script_});

    FinalTransaction paid;
    if (!pay(cand, paid, e)) return fail_ctx(e, "Failed to build merge transaction");

    FundingOutputs pos;
    if (!match_funding_outputs(paid.tx(), pay_script_, plan.chunk_output, plan.index_output, pos, e))
        return fail_ctx(e, "Failed to build merge transaction");

    out.chunk_funding = utxo_from_output(paid.txid_hex(), paid.tx(), (uint32_t)pos.chunk);
    out.index_funding = utxo_from_output(paid.txid_hex(), paid.tx(), (uint32_t)pos.index);
    out.tx = std::move(paid);
    log_info(LogCategory::TX, "merge tx " + out.tx.txid_hex() + ": chunk funding vout " +
             std::to_string(pos.chunk) + ", index funding vout " + std::to_string(pos.index));
    return true;
}

bool ChainBuilder::sign_single_input(Transaction& tx, const Utxo& funding, uint8_t sighash, Error& e) {
    InputSignature s;
    if (!wallet_.sign_input(tx_to_hex(tx), 0, funding.script_hex, funding.satoshis, sighash, s, e)) return false;

    std::vector<uint8_t> sig;
    if (!normalize_signature(s.signature_hex, sighash, sig, e)) return false;
    std::vector<uint8_t> pub = from_hex(s.public_key_hex);
    if (pub.size() != 33 && pub.size() != 65) {
        return fail(e, ErrKind::DependencyUnavailable, "wallet returned a malformed public key");
    }
    tx.vin[0].script_sig = p2pkh_unlock_script(sig, pub);
    return true;
}

bool ChainBuilder::build_open_pre_tx(const Utxo& funding, OpenTransaction& out, Error& e) {
    Transaction tx;
    tx.version = TX_VERSION;
    TxIn in;
    if (!outpoint_for(funding, in, e)) return false;
    tx.vin.push_back(std::move(in));

    if (!sign_single_input(tx, funding, SIGHASH_OPEN, e)) return false;
    out = OpenTransaction(std::move(tx), SIGHASH_OPEN);
    return true;
}

bool ChainBuilder::build_chain(const UtxoSelection& sel, const FundingPlan& plan, ChainBundle& out, Error& e) {
    MergeResult merge;
    if (!build_merge(sel, plan, merge, e)) return false;

    OpenTransaction chunk_pre, index_pre;
    if (!build_open_pre_tx(merge.chunk_funding, chunk_pre, e))
        return fail_ctx(e, "Failed to build chunk funding pre-tx");
    if (!build_open_pre_tx(merge.index_funding, index_pre, e))
        return fail_ctx(e, "Failed to build index pre-tx");

    out.merge = std::move(merge.tx);
    out.chunk_pre = std::move(chunk_pre);
    out.index_pre = std::move(index_pre);
    return true;
}

bool ChainBuilder::merge_to_single(const UtxoSelection& sel, uint64_t amount,
                                   FinalTransaction& merge, Utxo& funding, Error& e) {
    if (!check_address(e)) return fail_ctx(e, "Failed to merge UTXOs");

    PaymentCandidate cand;
    cand.tx.version = TX_VERSION;
    for (const auto& u : sel.selected) {
        TxIn in;
        if (!outpoint_for(u, in, e)) return fail_ctx(e, "Failed to merge UTXOs");
        cand.tx.vin.push_back(std::move(in));
        cand.inputs.push_back(u);
    }
    cand.tx.vout.push_back(TxOut{amount, pay_script_});

    FinalTransaction paid;
    if (!pay(cand, paid, e)) return fail_ctx(e, "Failed to merge UTXOs");
    if (paid.tx().vout.empty()) {
        return fail(e, ErrKind::OutputMatchFailure, "Failed to merge UTXOs: merge transaction has no outputs");
    }

    uint32_t vout = 0;
    for (size_t i = 0; i < paid.tx().vout.size(); ++i) {
        if (paid.tx().vout[i].script_pubkey == pay_script_) { vout = (uint32_t)i; break; }
    }
    funding = utxo_from_output(paid.txid_hex(), paid.tx(), vout);
    merge = std::move(paid);
    return true;
}

bool ChainBuilder::build_direct_base(const Utxo& funding, OpenTransaction& out, Error& e) {
    if (!check_address(e)) return fail_ctx(e, "Failed to build base transaction");

    Transaction tx;
    tx.version = TX_VERSION;
    TxIn in;
    if (!outpoint_for(funding, in, e)) return fail_ctx(e, "Failed to build base transaction");
    tx.vin.push_back(std::move(in));
    tx.vout.push_back(TxOut{1, pay_script_});

    if (!sign_single_input(tx, funding, SIGHASH_DIRECT, e)) return fail_ctx(e, "Failed to build base transaction");
    out = OpenTransaction(std::move(tx), SIGHASH_DIRECT);
    return true;
}

}
