#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "errors.h"
#include "tx.h"
#include "upload_types.h"

namespace mfs {

// Unsigned transaction handed to the wallet for funding and signing. The
// wallet may add inputs and a change output.
struct PaymentCandidate {
    Transaction tx;
    std::vector<Utxo> inputs;   // in input order, for amounts and scripts
};

struct SignedPayment {
    std::string raw_hex;
    std::string txid;           // display hex; empty when the wallet did not report it
};

struct InputSignature {
    std::string signature_hex;  // DER, optionally followed by a sighash byte
    std::string public_key_hex;
};

// Key management and signing live outside this process.
class WalletProvider {
public:
    virtual ~WalletProvider() = default;

    virtual bool get_spendable_outputs(std::vector<Utxo>& out, Error& e) = 0;
    virtual bool pay_and_sign(const PaymentCandidate& candidate, double fee_rate,
                              SignedPayment& out, Error& e) = 0;
    virtual bool sign_input(const std::string& tx_hex, uint32_t input_index,
                            const std::string& script_hex, uint64_t satoshis, uint8_t sighash,
                            InputSignature& out, Error& e) = 0;
};

}
