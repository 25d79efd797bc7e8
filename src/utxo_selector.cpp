#include "utxo_selector.h"
#include "constants.h"
#include "log.h"

#include <algorithm>

namespace mfs {

bool select_utxos(const std::vector<Utxo>& utxos, uint64_t required,
                  UtxoSelection& out, Error& e) {
    out = UtxoSelection{};
    if (utxos.empty()) {
        return fail(e, ErrKind::InsufficientFunds, "No available UTXOs. Please ensure your wallet has sufficient balance.");
    }

    std::vector<Utxo> usable;
    usable.reserve(utxos.size());
    for (const auto& u : utxos) {
        if (u.satoshis > DUST_LIMIT) usable.push_back(u);
    }
    if (usable.empty()) {
        return fail(e, ErrKind::InsufficientFunds,
                    "No UTXOs above the dust limit (" + std::to_string(DUST_LIMIT) + " sat) are available.");
    }

    std::stable_sort(usable.begin(), usable.end(),
                     [](const Utxo& a, const Utxo& b){ return a.satoshis > b.satoshis; });

    const uint64_t target = required + 1;
    for (auto& u : usable) {
        out.total += u.satoshis;
        out.selected.push_back(std::move(u));
        if (out.total >= target) break;
    }

    if (out.total < target) {
        const uint64_t have = out.total;
        out = UtxoSelection{};
        return fail(e, ErrKind::InsufficientFunds,
                    "Insufficient balance. Need " + std::to_string(target) +
                    " satoshis, have " + std::to_string(have) + " satoshis.");
    }

    MFS_LOG_DEBUG(LogCategory::WALLET, "selected " + std::to_string(out.selected.size()) + " utxos totalling " +
              std::to_string(out.total) + " sat for " + std::to_string(required));
    return true;
}

}
