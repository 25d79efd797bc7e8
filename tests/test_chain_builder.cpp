// Merge transaction output matching, signature handling and the open
// pre-transactions.
#include "test_support.h"
#include "chain_builder.h"
#include "constants.h"

#include <cstdio>

using namespace mfs;
using mfstest::make_utxo;

static std::vector<uint8_t> our_script() { return p2pkh_script(from_hex(mfstest::kPkhHex)); }
static std::vector<uint8_t> other_script() { return p2pkh_script(std::vector<uint8_t>(20, 0x42)); }

static int test_matching() {
    FundingOutputs pos;
    Error e;
    {
        Transaction tx;
        tx.vout.push_back(TxOut{777, other_script()});
        tx.vout.push_back(TxOut{2350, our_script()});
        tx.vout.push_back(TxOut{10350, our_script()});
        TEST_CHECK(match_funding_outputs(tx, our_script(), 10350, 2350, pos, e), "exact match");
        TEST_CHECK(pos.chunk == 2 && pos.index == 1, "positions independent of order");
    }
    {
        // an output exactly matching the index amount must not be taken by the chunk tolerance pass
        Transaction tx;
        tx.vout.push_back(TxOut{5300, our_script()});
        tx.vout.push_back(TxOut{5000, our_script()});
        TEST_CHECK(match_funding_outputs(tx, our_script(), 5200, 5000, pos, e), "exact wins over tolerance");
        TEST_CHECK(pos.chunk == 0 && pos.index == 1, "chunk by tolerance, index exact");
    }
    {
        Transaction tx;
        tx.vout.push_back(TxOut{11000, our_script()});
        tx.vout.push_back(TxOut{2000, our_script()});
        TEST_CHECK(match_funding_outputs(tx, our_script(), 10350, 2350, pos, e), "tolerance pass");
        TEST_CHECK(pos.chunk == 0 && pos.index == 1, "tolerance positions");
    }
    {
        Transaction tx;
        tx.vout.push_back(TxOut{3000, our_script()});
        TEST_CHECK(!match_funding_outputs(tx, our_script(), 3000, 3000, pos, e), "one output cannot fund both");
        TEST_CHECK(e.kind == ErrKind::OutputMatchFailure, "match failure kind");
        TEST_CHECK(e.message.find("index") != std::string::npos, "index output named");
    }
    {
        Transaction tx;
        tx.vout.push_back(TxOut{10350, other_script()});
        tx.vout.push_back(TxOut{2350, our_script()});
        e.clear();
        TEST_CHECK(!match_funding_outputs(tx, our_script(), 10350, 2350, pos, e), "foreign script ignored");
        TEST_CHECK(e.message.find("chunk") != std::string::npos, "chunk output named");
    }
    {
        Transaction tx;
        tx.vout.push_back(TxOut{10350 + 1001, our_script()});
        tx.vout.push_back(TxOut{2350, our_script()});
        TEST_CHECK(!match_funding_outputs(tx, our_script(), 10350, 2350, pos, e), "outside tolerance");
    }
    TEST_PASS("output matching");
    return 0;
}

static int test_signatures() {
    std::vector<uint8_t> out;
    Error e;
    TEST_CHECK(is_der_signature(from_hex("3006020101020101")), "minimal DER");
    TEST_CHECK(!is_der_signature(from_hex("300602010102010141")), "sighash byte is not DER");
    TEST_CHECK(!is_der_signature(from_hex("3006020181020101")), "negative r rejected");

    TEST_CHECK(normalize_signature("3006020101020101", SIGHASH_OPEN, out, e), "bare DER accepted");
    TEST_CHECK(out.size() == 9 && out.back() == 0xC2, "our sighash appended");
    TEST_CHECK(normalize_signature("300602010102010141", SIGHASH_OPEN, out, e), "DER plus wallet hashtype");
    TEST_CHECK(out.size() == 9 && out.back() == 0xC2, "wallet hashtype replaced");
    TEST_CHECK(!normalize_signature("deadbeef", SIGHASH_OPEN, out, e), "garbage rejected");
    TEST_CHECK(e.kind == ErrKind::DependencyUnavailable, "bad signature kind");
    TEST_CHECK(!normalize_signature("", SIGHASH_OPEN, out, e), "empty rejected");
    TEST_PASS("signatures");
    return 0;
}

static int test_chain() {
    mfstest::FakeWallet w;
    ChainBuilder b(w, mfstest::kAddress, 1);
    UtxoSelection sel;
    sel.selected = {make_utxo('a', 0, 20000), make_utxo('b', 1, 5000)};
    sel.total = 25000;
    FundingPlan plan;
    plan.chunk_output = 10350;
    plan.index_output = 2350;
    plan.merge_fee = 568;
    plan.total_required = 13268;

    ChainBundle chain;
    Error e;
    TEST_CHECK(b.build_chain(sel, plan, chain, e), "chain builds");
    TEST_CHECK(w.payments.size() == 1, "one payment");
    const auto& cand = w.payments[0];
    TEST_CHECK(cand.tx.vin.size() == 2 && cand.inputs.size() == 2, "all selected inputs offered");
    TEST_CHECK(cand.tx.vout.size() == 2 && cand.tx.vout[0].value == 10350 && cand.tx.vout[1].value == 2350,
               "two funding outputs requested");
    TEST_CHECK(cand.tx.version == TX_VERSION, "version 10");
    TEST_CHECK(chain.merge.tx().vout.size() == 3, "wallet change kept");
    TEST_CHECK(chain.merge.txid_hex() == w.paid_txids[0], "wallet txid used");

    const Transaction& c = chain.chunk_pre.tx();
    const Transaction& i = chain.index_pre.tx();
    TEST_CHECK(c.vin.size() == 1 && c.vout.empty(), "chunk pre-tx: one input, no outputs");
    TEST_CHECK(i.vin.size() == 1 && i.vout.empty(), "index pre-tx: one input, no outputs");
    TEST_CHECK(txid_to_hex(c.vin[0].prev.txid) == w.paid_txids[0] && c.vin[0].prev.vout == 1,
               "chunk pre-tx spends merge output 1 (after change)");
    TEST_CHECK(i.vin[0].prev.vout == 2, "index pre-tx spends merge output 2");
    TEST_CHECK(chain.chunk_pre.sighash() == SIGHASH_OPEN && chain.index_pre.sighash() == SIGHASH_OPEN, "open sighash");
    TEST_CHECK(w.sighashes.size() == 2 && w.sighashes[0] == 0xC2 && w.sighashes[1] == 0xC2, "wallet asked for 0xC2");
    const auto& ss = c.vin[0].script_sig;
    TEST_CHECK(ss.size() == 1 + 9 + 1 + 33 && ss[0] == 9 && ss[9] == 0xC2 && ss[10] == 33, "unlock script sig||pub");
    TEST_PASS("funding chain");

    // wallet without a txid: computed from the transaction
    mfstest::FakeWallet w2;
    w2.report_txid = false;
    w2.bare_der = true;
    ChainBuilder b2(w2, mfstest::kAddress, 1);
    TEST_CHECK(b2.build_chain(sel, plan, chain, e), "chain without wallet txid");
    TEST_CHECK(chain.merge.txid_hex() == chain.merge.tx().txid_hex(), "txid derived");

    // amounts shifted by the wallet inside the tolerance
    mfstest::FakeWallet w3;
    w3.amount_nudge = -400;
    ChainBuilder b3(w3, mfstest::kAddress, 1);
    TEST_CHECK(b3.build_chain(sel, plan, chain, e), "tolerated shift");

    mfstest::FakeWallet w4;
    w4.amount_nudge = 2000;
    ChainBuilder b4(w4, mfstest::kAddress, 1);
    e.clear();
    TEST_CHECK(!b4.build_chain(sel, plan, chain, e), "shift beyond tolerance");
    TEST_CHECK(e.kind == ErrKind::OutputMatchFailure, "output match failure");
    TEST_CHECK(e.message.find("Failed to build merge transaction") == 0, "merge context");

    mfstest::FakeWallet w5;
    w5.sign_error = "User cancelled";
    ChainBuilder b5(w5, mfstest::kAddress, 1);
    e.clear();
    TEST_CHECK(!b5.build_chain(sel, plan, chain, e), "signing refused");
    TEST_CHECK(e.message.find("Failed to build chunk funding pre-tx") == 0, "pre-tx context");

    ChainBuilder bad(w, "nonsense", 1);
    e.clear();
    TEST_CHECK(!bad.build_chain(sel, plan, chain, e) && e.kind == ErrKind::InvalidInput, "bad address");
    TEST_PASS("funding chain failures");
    return 0;
}

static int test_direct_base() {
    mfstest::FakeWallet w;
    ChainBuilder b(w, mfstest::kAddress, 1);
    UtxoSelection sel;
    sel.selected = {make_utxo('a', 0, 1500), make_utxo('b', 4, 900)};
    FinalTransaction merge;
    Utxo funding;
    Error e;
    TEST_CHECK(b.merge_to_single(sel, 2000, merge, funding, e), "merge to single");
    TEST_CHECK(w.payments[0].tx.vout.size() == 1 && w.payments[0].tx.vout[0].value == 2000, "single output requested");
    TEST_CHECK(funding.vout == 1 && funding.satoshis == 2000 && funding.txid == merge.txid_hex(),
               "funding is the output paying us");

    OpenTransaction base;
    TEST_CHECK(b.build_direct_base(funding, base, e), "direct base");
    TEST_CHECK(base.tx().vin.size() == 1 && base.tx().vout.size() == 1 && base.tx().vout[0].value == 1,
               "one input, one 1-sat output");
    TEST_CHECK(base.sighash() == SIGHASH_DIRECT && w.sighashes.back() == 0xC3, "direct sighash");
    TEST_PASS("direct base");
    return 0;
}

int main() {
    log_init(LogLevel::WARN);
    if (test_matching()) return 1;
    if (test_signatures()) return 1;
    if (test_chain()) return 1;
    if (test_direct_base()) return 1;
    std::printf("All chain builder tests passed!\n");
    return 0;
}
