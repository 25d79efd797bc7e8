#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace mfs {
// Returns an empty vector on odd length or a non-hex character.
std::vector<uint8_t> from_hex(const std::string& hex);
std::string to_hex(const std::vector<uint8_t>& v);
bool is_hex(const std::string& hex);

// Transaction ids are displayed byte-reversed relative to their hash bytes.
std::vector<uint8_t> txid_from_hex(const std::string& display_hex);
std::string txid_to_hex(const std::vector<uint8_t>& internal);
}
