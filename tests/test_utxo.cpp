// Largest-first coin selection with the dust floor.
#include "test_support.h"
#include "utxo_selector.h"

#include <cstdio>

using namespace mfs;
using mfstest::make_utxo;

int main() {
    log_init(LogLevel::WARN);
    UtxoSelection sel;
    Error e;

    TEST_CHECK(!select_utxos({}, 1000, sel, e), "empty wallet");
    TEST_CHECK(e.kind == ErrKind::InsufficientFunds, "empty wallet kind");
    TEST_CHECK(e.message.find("No available UTXOs") == 0, "empty wallet message");

    e.clear();
    TEST_CHECK(!select_utxos({make_utxo('a', 0, 600), make_utxo('b', 0, 100)}, 10, sel, e), "dust only");
    TEST_CHECK(e.message.find("dust") != std::string::npos, "dust message");

    {
        std::vector<Utxo> w = {make_utxo('a', 0, 5000), make_utxo('b', 1, 20000), make_utxo('c', 2, 600),
                               make_utxo('d', 3, 8000)};
        TEST_CHECK(select_utxos(w, 20000, sel, e), "two needed when the largest equals the target");
        TEST_CHECK(sel.selected.size() == 2, "strictly more than required");
        TEST_CHECK(sel.selected[0].satoshis == 20000 && sel.selected[1].satoshis == 8000, "largest first");
        TEST_CHECK(sel.total == 28000, "total");

        TEST_CHECK(select_utxos(w, 19999, sel, e) && sel.selected.size() == 1, "one suffices below the largest");

        e.clear();
        TEST_CHECK(!select_utxos(w, 40000, sel, e), "not enough");
        TEST_CHECK(e.message == "Insufficient balance. Need 40001 satoshis, have 33000 satoshis.", "shortfall message");
        TEST_CHECK(sel.selected.empty(), "selection cleared on failure");
    }

    {
        std::vector<Utxo> w = {make_utxo('a', 0, 700), make_utxo('b', 0, 700), make_utxo('c', 0, 900)};
        TEST_CHECK(select_utxos(w, 1000, sel, e), "ties");
        TEST_CHECK(sel.selected[0].satoshis == 900 && sel.selected[1].txid[0] == 'a', "stable among equal values");
    }

    TEST_PASS("utxo selection");
    std::printf("All utxo tests passed!\n");
    return 0;
}
