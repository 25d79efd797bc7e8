#include "tx.h"
#include "address.h"
#include "hash.h"
#include "hex.h"
#include "serialize.h"

#include <utility>

namespace mfs {

std::vector<uint8_t> Transaction::txid() const {
    return dsha256(ser_tx(*this));
}

std::string Transaction::txid_hex() const {
    return txid_to_hex(txid());
}

uint64_t Transaction::total_out() const {
    uint64_t s = 0;
    for (const auto& o : vout) s += o.value;
    return s;
}

std::vector<uint8_t> p2pkh_script(const std::vector<uint8_t>& pkh) {
    std::vector<uint8_t> s;
    s.reserve(25);
    s.push_back(0x76);  // OP_DUP
    s.push_back(0xa9);  // OP_HASH160
    s.push_back(0x14);
    s.insert(s.end(), pkh.begin(), pkh.end());
    s.push_back(0x88);  // OP_EQUALVERIFY
    s.push_back(0xac);  // OP_CHECKSIG
    return s;
}

bool p2pkh_script_for_address(const std::string& addr, std::vector<uint8_t>& script) {
    std::vector<uint8_t> pkh;
    if (!decode_p2pkh_address(addr, pkh)) return false;
    script = p2pkh_script(pkh);
    return true;
}

bool p2pkh_script_hash(const std::vector<uint8_t>& s, std::vector<uint8_t>& pkh) {
    if (s.size() != 25) return false;
    if (s[0] != 0x76 || s[1] != 0xa9 || s[2] != 0x14 || s[23] != 0x88 || s[24] != 0xac) return false;
    pkh.assign(s.begin() + 3, s.begin() + 23);
    return true;
}

std::vector<uint8_t> script_push(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> s;
    const size_t n = data.size();
    if (n < 0x4c) {
        s.push_back((uint8_t)n);
    } else if (n <= 0xff) {
        s.push_back(0x4c);
        s.push_back((uint8_t)n);
    } else if (n <= 0xffff) {
        s.push_back(0x4d);
        s.push_back((uint8_t)(n & 0xff));
        s.push_back((uint8_t)((n >> 8) & 0xff));
    } else {
        s.push_back(0x4e);
        for (int i = 0; i < 4; ++i) s.push_back((uint8_t)((n >> (8 * i)) & 0xff));
    }
    s.insert(s.end(), data.begin(), data.end());
    return s;
}

std::vector<uint8_t> p2pkh_unlock_script(const std::vector<uint8_t>& sig_with_mode,
                                         const std::vector<uint8_t>& pubkey) {
    auto s = script_push(sig_with_mode);
    auto p = script_push(pubkey);
    s.insert(s.end(), p.begin(), p.end());
    return s;
}

std::string OpenTransaction::hex() const { return to_hex(ser_tx(tx_)); }
std::string FinalTransaction::hex() const { return to_hex(ser_tx(tx_)); }

}
