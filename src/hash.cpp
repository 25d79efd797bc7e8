#include "hash.h"

#include <openssl/evp.h>

namespace mfs {

static std::vector<uint8_t> evp_digest(const EVP_MD* md, const uint8_t* data, size_t len){
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int l = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(!ctx) return {};
    bool ok = EVP_DigestInit_ex(ctx, md, nullptr) == 1
           && EVP_DigestUpdate(ctx, data, len) == 1
           && EVP_DigestFinal_ex(ctx, out.data(), &l) == 1;
    EVP_MD_CTX_free(ctx);
    if(!ok) return {};
    out.resize(l);
    return out;
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data){
    return evp_digest(EVP_sha256(), data.data(), data.size());
}

std::vector<uint8_t> dsha256(const std::vector<uint8_t>& data){
    return sha256(sha256(data));
}

std::vector<uint8_t> ripemd160(const std::vector<uint8_t>& data){
    return evp_digest(EVP_ripemd160(), data.data(), data.size());
}

std::vector<uint8_t> hash160(const std::vector<uint8_t>& data){
    return ripemd160(sha256(data));
}

std::string base64_encode(const uint8_t* data, size_t len){
    if(len == 0) return {};
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, (int)len);
    if(n < 0) return {};
    out.resize((size_t)n);
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data){
    return base64_encode(data.data(), data.size());
}

bool base64_decode(const std::string& in, std::vector<uint8_t>& out){
    out.clear();
    if(in.empty()) return true;
    if(in.size() % 4 != 0) return false;
    std::vector<uint8_t> buf(3 * (in.size() / 4) + 1);
    int n = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(in.data()), (int)in.size());
    if(n < 0) return false;
    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    size_t pad = 0;
    if(in[in.size()-1] == '=') pad++;
    if(in[in.size()-2] == '=') pad++;
    buf.resize((size_t)n - pad);
    out.swap(buf);
    return true;
}

} // namespace mfs
