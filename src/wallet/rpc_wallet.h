#pragma once
#include <string>

#include "http_client.h"
#include "json.h"
#include "wallet.h"

namespace mfs {

// WalletProvider backed by a JSON-RPC wallet daemon:
//   getutxos        []                                   -> [{txid,vout,script,satoshis}]
//   pay             [{txHex,inputs,feeRate}]             -> {txHex,txid}
//   signtransaction [{txHex,inputIndex,script,satoshis,sigtype}] -> {sig,publicKey}
class RpcWallet : public WalletProvider {
public:
    RpcWallet(HttpTransport& http, std::string url, std::string token = "")
        : http_(http), url_(std::move(url)), token_(std::move(token)) {}

    // Token from MFS_WALLET_TOKEN, else the first line of cookie_path.
    bool load_token(const std::string& cookie_path);

    bool get_spendable_outputs(std::vector<Utxo>& out, Error& e) override;
    bool pay_and_sign(const PaymentCandidate& candidate, double fee_rate,
                      SignedPayment& out, Error& e) override;
    bool sign_input(const std::string& tx_hex, uint32_t input_index,
                    const std::string& script_hex, uint64_t satoshis, uint8_t sighash,
                    InputSignature& out, Error& e) override;

private:
    HttpTransport& http_;
    std::string url_;
    std::string token_;

    bool call(const std::string& method, JArr params, JNode& result, Error& e);
};

}
