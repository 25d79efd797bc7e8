#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mfs {

enum class Network { Livenet, Testnet };

uint8_t p2pkh_version(Network net);
bool parse_network(const std::string& name, Network& out);
const char* network_name(Network net);

// Accepts either network's version byte; out_net reports which one matched.
bool decode_p2pkh_address(const std::string& addr, std::vector<uint8_t>& out_pkh, Network* out_net = nullptr);
std::string encode_p2pkh_address(const std::vector<uint8_t>& pkh, Network net);
}
