#include "hex.h"
#include <algorithm>

namespace mfs {

static const char kDigits[] = "0123456789abcdef";

// -1 for anything outside [0-9a-fA-F]
static int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_hex(const std::string& hex) {
    return hex.size() % 2 == 0 &&
           std::all_of(hex.begin(), hex.end(), [](char c){ return nibble(c) >= 0; });
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    if (!is_hex(hex)) return {};
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        out.push_back((uint8_t)((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& v) {
    std::string out;
    out.reserve(v.size() * 2);
    for (uint8_t b : v) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0f]);
    }
    return out;
}

std::vector<uint8_t> txid_from_hex(const std::string& display_hex) {
    std::vector<uint8_t> b = from_hex(display_hex);
    if (b.size() != 32) return {};
    std::reverse(b.begin(), b.end());
    return b;
}

std::string txid_to_hex(const std::vector<uint8_t>& internal) {
    return to_hex(std::vector<uint8_t>(internal.rbegin(), internal.rend()));
}

}
