#include "serialize.h"
#include "hex.h"

namespace mfs {

static inline void put_u32(std::vector<uint8_t>& v, uint32_t x){ for(int i=0;i<4;i++) v.push_back(uint8_t((x>>(i*8))&0xff)); }
static inline void put_u64(std::vector<uint8_t>& v, uint64_t x){ for(int i=0;i<8;i++) v.push_back(uint8_t((x>>(i*8))&0xff)); }
static inline uint32_t get_u32(const std::vector<uint8_t>& v, size_t i){ return uint32_t(v[i]) | (uint32_t(v[i+1])<<8) | (uint32_t(v[i+2])<<16) | (uint32_t(v[i+3])<<24); }
static inline uint64_t get_u64(const std::vector<uint8_t>& v, size_t i){ uint64_t x=0; for(int k=0;k<8;k++) x |= (uint64_t)v[i+k] << (k*8); return x; }

void put_varint(std::vector<uint8_t>& v, uint64_t n){
    if(n < 0xfd){ v.push_back((uint8_t)n); }
    else if(n <= 0xffff){ v.push_back(0xfd); v.push_back(uint8_t(n&0xff)); v.push_back(uint8_t((n>>8)&0xff)); }
    else if(n <= 0xffffffffULL){ v.push_back(0xfe); put_u32(v, (uint32_t)n); }
    else { v.push_back(0xff); put_u64(v, n); }
}

bool get_varint(const std::vector<uint8_t>& v, size_t& i, uint64_t& n){
    if(i>=v.size()) return false;
    uint8_t p = v[i++];
    if(p < 0xfd){ n = p; return true; }
    if(p == 0xfd){ if(i+2>v.size()) return false; n = uint64_t(v[i]) | (uint64_t(v[i+1])<<8); i+=2; return true; }
    if(p == 0xfe){ if(i+4>v.size()) return false; n = get_u32(v,i); i+=4; return true; }
    if(i+8>v.size()) return false; n = get_u64(v,i); i+=8; return true;
}

static inline void put_var(std::vector<uint8_t>& v, const std::vector<uint8_t>& b){ put_varint(v, b.size()); v.insert(v.end(), b.begin(), b.end()); }

static inline bool get_var(const std::vector<uint8_t>& v, size_t& i, std::vector<uint8_t>& out){
    uint64_t sz=0; if(!get_varint(v,i,sz)) return false;
    if(sz > v.size()-i) return false;
    out.assign(v.begin()+(long)i, v.begin()+(long)(i+sz)); i+=(size_t)sz; return true;
}

std::vector<uint8_t> ser_tx(const Transaction& tx){
    std::vector<uint8_t> v;
    v.reserve(16 + tx.vin.size()*150 + tx.vout.size()*34);
    put_u32(v, tx.version);
    put_varint(v, tx.vin.size());
    for(const auto& in : tx.vin){
        v.insert(v.end(), in.prev.txid.begin(), in.prev.txid.end());
        put_u32(v, in.prev.vout);
        put_var(v, in.script_sig);
        put_u32(v, in.sequence);
    }
    put_varint(v, tx.vout.size());
    for(const auto& o : tx.vout){
        put_u64(v, o.value);
        put_var(v, o.script_pubkey);
    }
    put_u32(v, tx.lock_time);
    return v;
}

bool deser_tx(const std::vector<uint8_t>& b, Transaction& tx){
    size_t i=0; if(b.size()<4) return false;
    tx.version = get_u32(b, i); i+=4;
    uint64_t nin=0; if(!get_varint(b,i,nin)) return false;
    // each input needs at least 41 bytes
    if(nin > (b.size()-i)/41) return false;
    tx.vin.clear(); tx.vin.reserve((size_t)nin);
    for(uint64_t k=0;k<nin;k++){
        TxIn in{};
        if(i+36>b.size()) return false;
        in.prev.txid.assign(b.begin()+(long)i, b.begin()+(long)(i+32)); i+=32;
        in.prev.vout = get_u32(b,i); i+=4;
        if(!get_var(b,i,in.script_sig)) return false;
        if(i+4>b.size()) return false; in.sequence = get_u32(b,i); i+=4;
        tx.vin.push_back(std::move(in));
    }
    uint64_t nout=0; if(!get_varint(b,i,nout)) return false;
    if(nout > (b.size()-i)/9) return false;
    tx.vout.clear(); tx.vout.reserve((size_t)nout);
    for(uint64_t k=0;k<nout;k++){
        TxOut o{};
        if(i+8>b.size()) return false; o.value = get_u64(b,i); i+=8;
        if(!get_var(b,i,o.script_pubkey)) return false;
        tx.vout.push_back(std::move(o));
    }
    if(i+4>b.size()) return false; tx.lock_time = get_u32(b,i); i+=4;
    return i==b.size();
}

bool tx_from_hex(const std::string& hex, Transaction& tx){
    if(hex.empty() || !is_hex(hex)) return false;
    return deser_tx(from_hex(hex), tx);
}

std::string tx_to_hex(const Transaction& tx){ return to_hex(ser_tx(tx)); }

}
