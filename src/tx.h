#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "constants.h"

namespace mfs {

// txid is kept in internal (hash) byte order; display hex is reversed.
struct OutPoint { std::vector<uint8_t> txid; uint32_t vout{0}; };

struct TxIn {
    OutPoint prev;
    std::vector<uint8_t> script_sig;
    uint32_t sequence{0xffffffff};
};

struct TxOut { uint64_t value{0}; std::vector<uint8_t> script_pubkey; };

struct Transaction {
    uint32_t version{TX_VERSION};
    std::vector<TxIn> vin;
    std::vector<TxOut> vout;
    uint32_t lock_time{0};

    std::vector<uint8_t> txid() const;
    std::string txid_hex() const;
    uint64_t total_out() const;
};

// === Scripts ===
std::vector<uint8_t> p2pkh_script(const std::vector<uint8_t>& pkh);
bool p2pkh_script_for_address(const std::string& addr, std::vector<uint8_t>& script);
// Extracts the 20-byte hash from a canonical P2PKH locking script.
bool p2pkh_script_hash(const std::vector<uint8_t>& script, std::vector<uint8_t>& pkh);
// Smallest push opcode for data (direct push, PUSHDATA1/2/4).
std::vector<uint8_t> script_push(const std::vector<uint8_t>& data);
std::vector<uint8_t> p2pkh_unlock_script(const std::vector<uint8_t>& sig_with_mode,
                                         const std::vector<uint8_t>& pubkey);

// A transaction whose outputs can still be appended by a third party: its
// inputs are signed with a mode that does not commit to (all of) them.
class OpenTransaction {
public:
    OpenTransaction() = default;
    OpenTransaction(Transaction tx, uint8_t sighash) : tx_(std::move(tx)), sighash_(sighash) {}

    const Transaction& tx() const { return tx_; }
    uint8_t sighash() const { return sighash_; }
    std::string hex() const;

private:
    Transaction tx_;
    uint8_t sighash_{SIGHASH_OPEN};
};

// Fully signed; the only kind that may be broadcast.
class FinalTransaction {
public:
    FinalTransaction() = default;
    FinalTransaction(Transaction tx, std::string txid_hex)
        : tx_(std::move(tx)), txid_hex_(std::move(txid_hex)) {}

    const Transaction& tx() const { return tx_; }
    const std::string& txid_hex() const { return txid_hex_; }
    std::string hex() const;

private:
    Transaction tx_;
    std::string txid_hex_;
};

}
