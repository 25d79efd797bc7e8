#include "address.h"
#include "base58.h"
#include "constants.h"

namespace mfs {

uint8_t p2pkh_version(Network net) {
    return net == Network::Testnet ? VERSION_P2PKH_TESTNET : VERSION_P2PKH_LIVENET;
}

bool parse_network(const std::string& name, Network& out) {
    if (name == "livenet" || name == "mainnet") { out = Network::Livenet; return true; }
    if (name == "testnet") { out = Network::Testnet; return true; }
    return false;
}

const char* network_name(Network net) {
    return net == Network::Testnet ? "testnet" : "livenet";
}

bool decode_p2pkh_address(const std::string& addr, std::vector<uint8_t>& out_pkh, Network* out_net) {
    uint8_t ver = 0;
    std::vector<uint8_t> payload;
    if (!base58check_decode(addr, ver, payload)) return false;
    if (payload.size() != 20) return false;
    Network net;
    if (ver == VERSION_P2PKH_LIVENET) net = Network::Livenet;
    else if (ver == VERSION_P2PKH_TESTNET) net = Network::Testnet;
    else return false;
    if (out_net) *out_net = net;
    out_pkh = payload;
    return true;
}

std::string encode_p2pkh_address(const std::vector<uint8_t>& pkh, Network net) {
    return base58check_encode(p2pkh_version(net), pkh);
}

}
