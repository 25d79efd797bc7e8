#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mfs {

// Digests via OpenSSL EVP. An empty result means the digest backend failed.
std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);
std::vector<uint8_t> dsha256(const std::vector<uint8_t>& data);
std::vector<uint8_t> ripemd160(const std::vector<uint8_t>& data);
std::vector<uint8_t> hash160(const std::vector<uint8_t>& data);

// Standard (padded) base64.
std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::vector<uint8_t>& data);
bool base64_decode(const std::string& in, std::vector<uint8_t>& out);

} // namespace mfs
