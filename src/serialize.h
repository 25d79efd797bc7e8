#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "tx.h"

namespace mfs {
// Bitcoin-style wire format with CompactSize counts and lengths.
std::vector<uint8_t> ser_tx(const Transaction& tx);
bool deser_tx(const std::vector<uint8_t>& b, Transaction& tx);

bool tx_from_hex(const std::string& hex, Transaction& tx);
std::string tx_to_hex(const Transaction& tx);

void put_varint(std::vector<uint8_t>& v, uint64_t n);
bool get_varint(const std::vector<uint8_t>& v, size_t& i, uint64_t& n);
}
