#include "base58.h"
#include "hash.h"

#include <cstring>

namespace mfs {

static const char* B58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static int b58_index(char c) {
    if (c == '\0') return -1;
    const char* p = std::strchr(B58_ALPHABET, c);
    return p ? int(p - B58_ALPHABET) : -1;
}

// Big-number base conversion over a byte buffer; digits land right-aligned.
static void convert_base(const std::vector<int>& digits, size_t start, int from, int to,
                         std::vector<uint8_t>& acc) {
    size_t used = 0;
    for (size_t i = start; i < digits.size(); ++i) {
        int carry = digits[i];
        size_t k = 0;
        for (auto it = acc.rbegin(); (carry != 0 || k < used) && it != acc.rend(); ++it, ++k) {
            int x = (*it) * from + carry;
            *it = (uint8_t)(x % to);
            carry = x / to;
        }
        used = k;
    }
}

std::string base58_encode(const std::vector<uint8_t>& in) {
    size_t zeros = 0;
    while (zeros < in.size() && in[zeros] == 0) zeros++;

    std::vector<int> digits(in.begin(), in.end());
    std::vector<uint8_t> acc((in.size() - zeros) * 138 / 100 + 1, 0);
    convert_base(digits, zeros, 256, 58, acc);

    size_t first = 0;
    while (first < acc.size() && acc[first] == 0) first++;

    std::string out(zeros, '1');
    for (size_t i = first; i < acc.size(); ++i) out.push_back(B58_ALPHABET[acc[i]]);
    return out;
}

bool base58_decode(const std::string& s, std::vector<uint8_t>& out) {
    size_t zeros = 0;
    while (zeros < s.size() && s[zeros] == '1') zeros++;

    std::vector<int> digits;
    digits.reserve(s.size());
    for (char c : s) {
        int v = b58_index(c);
        if (v < 0) return false;
        digits.push_back(v);
    }

    std::vector<uint8_t> acc((s.size() - zeros) * 733 / 1000 + 1, 0);
    convert_base(digits, zeros, 58, 256, acc);

    size_t first = 0;
    while (first < acc.size() && acc[first] == 0) first++;

    out.assign(zeros, 0);
    out.insert(out.end(), acc.begin() + (long)first, acc.end());
    return true;
}

std::string base58check_encode(uint8_t version, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> b;
    b.reserve(payload.size() + 5);
    b.push_back(version);
    b.insert(b.end(), payload.begin(), payload.end());
    auto c = dsha256(b);
    if (c.size() < 4) return {};
    b.insert(b.end(), c.begin(), c.begin() + 4);
    return base58_encode(b);
}

bool base58check_decode(const std::string& s, uint8_t& version, std::vector<uint8_t>& payload) {
    std::vector<uint8_t> b;
    if (!base58_decode(s, b) || b.size() < 5) return false;
    std::vector<uint8_t> body(b.begin(), b.end() - 4);
    auto c = dsha256(body);
    if (c.size() < 4) return false;
    if (std::memcmp(c.data(), b.data() + b.size() - 4, 4) != 0) return false;
    version = b[0];
    payload.assign(b.begin() + 1, b.end() - 4);
    return true;
}

}
