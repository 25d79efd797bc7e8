#pragma once
#include <cstdint>
#include <vector>

#include "errors.h"
#include "upload_types.h"

namespace mfs {

// Largest-first accumulation over non-dust outputs until the total reaches
// required + 1. InsufficientFunds when it cannot.
bool select_utxos(const std::vector<Utxo>& utxos, uint64_t required,
                  UtxoSelection& out, Error& e);

}
