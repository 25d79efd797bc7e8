#include "json.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>
namespace mfs {
static void skip(const std::string& s, size_t& i){ while(i<s.size() && isspace((unsigned char)s[i])) ++i; }

static void put_utf8(std::string& o, uint32_t cp){
    if(cp < 0x80){ o.push_back((char)cp); }
    else if(cp < 0x800){ o.push_back((char)(0xC0 | (cp>>6))); o.push_back((char)(0x80 | (cp & 0x3F))); }
    else if(cp < 0x10000){ o.push_back((char)(0xE0 | (cp>>12))); o.push_back((char)(0x80 | ((cp>>6) & 0x3F))); o.push_back((char)(0x80 | (cp & 0x3F))); }
    else { o.push_back((char)(0xF0 | (cp>>18))); o.push_back((char)(0x80 | ((cp>>12) & 0x3F))); o.push_back((char)(0x80 | ((cp>>6) & 0x3F))); o.push_back((char)(0x80 | (cp & 0x3F))); }
}

static bool parse_hex4(const std::string& s, size_t i, uint32_t& out){
    if(i+4 > s.size()) return false;
    out = 0;
    for(size_t k=0;k<4;k++){
        char c = s[i+k]; out <<= 4;
        if(c>='0'&&c<='9') out |= (uint32_t)(c-'0');
        else if(c>='a'&&c<='f') out |= (uint32_t)(c-'a'+10);
        else if(c>='A'&&c<='F') out |= (uint32_t)(c-'A'+10);
        else return false;
    }
    return true;
}

static bool parse_string(const std::string& s, size_t& i, std::string& out){
    if(i>=s.size() || s[i]!='"') return false;
    ++i; std::string o;
    while(i<s.size() && s[i]!='"'){
        if(s[i]=='\\'){
            ++i; if(i>=s.size()) return false;
            char c=s[i];
            if(c=='"'||c=='\\'||c=='/') o.push_back(c);
            else if(c=='b') o.push_back('\b');
            else if(c=='f') o.push_back('\f');
            else if(c=='n') o.push_back('\n');
            else if(c=='r') o.push_back('\r');
            else if(c=='t') o.push_back('\t');
            else if(c=='u'){
                uint32_t cp=0; if(!parse_hex4(s, i+1, cp)) return false; i+=4;
                if(cp>=0xD800 && cp<=0xDBFF && i+6<s.size() && s[i+1]=='\\' && s[i+2]=='u'){
                    uint32_t lo=0;
                    if(parse_hex4(s, i+3, lo) && lo>=0xDC00 && lo<=0xDFFF){
                        cp = 0x10000 + ((cp-0xD800)<<10) + (lo-0xDC00); i+=6;
                    }
                }
                put_utf8(o, cp);
            }
            else return false;
        } else o.push_back(s[i]);
        ++i;
    }
    if(i>=s.size()||s[i]!='"') return false;
    ++i; out=std::move(o); return true;
}

static bool parse_value(const std::string& s, size_t& i, JNode& out, int depth);

static bool parse_array(const std::string& s, size_t& i, JNode& out, int depth){
    ++i; skip(s,i); JArr arr;
    if(i<s.size() && s[i]==']'){ ++i; out.v=std::move(arr); return true; }
    while(true){
        JNode val; if(!parse_value(s,i,val,depth+1)) return false;
        arr.push_back(std::move(val)); skip(s,i);
        if(i>=s.size()) return false;
        if(s[i]==','){ ++i; skip(s,i); continue; }
        if(s[i]==']'){ ++i; out.v=std::move(arr); return true; }
        return false;
    }
}

static bool parse_object(const std::string& s, size_t& i, JNode& out, int depth){
    ++i; skip(s,i); JObj obj;
    if(i<s.size() && s[i]=='}'){ ++i; out.v=std::move(obj); return true; }
    while(true){
        std::string k; if(!parse_string(s,i,k)) return false;
        skip(s,i); if(i>=s.size() || s[i]!=':') return false;
        ++i; skip(s,i);
        JNode val; if(!parse_value(s,i,val,depth+1)) return false;
        obj[k]=std::move(val); skip(s,i);
        if(i>=s.size()) return false;
        if(s[i]==','){ ++i; skip(s,i); continue; }
        if(s[i]=='}'){ ++i; out.v=std::move(obj); return true; }
        return false;
    }
}

static bool parse_number(const std::string& s, size_t& i, double& out){
    size_t j=i;
    if(i<s.size() && s[i]=='-') ++i;
    size_t digits=i;
    while(i<s.size() && isdigit((unsigned char)s[i])) ++i;
    if(i==digits) return false;
    if(i<s.size() && s[i]=='.'){ ++i; while(i<s.size()&&isdigit((unsigned char)s[i])) ++i; }
    if(i<s.size() && (s[i]=='e'||s[i]=='E')){
        ++i; if(i<s.size() && (s[i]=='+'||s[i]=='-')) ++i;
        while(i<s.size()&&isdigit((unsigned char)s[i])) ++i;
    }
    out = std::strtod(s.substr(j, i-j).c_str(), nullptr);
    return true;
}

static bool parse_value(const std::string& s, size_t& i, JNode& out, int depth){
    if(depth > 64) return false;
    skip(s,i); if(i>=s.size()) return false;
    if(s[i]=='"'){ std::string str; if(!parse_string(s,i,str)) return false; out.v=std::move(str); return true; }
    if(s[i]=='{') return parse_object(s,i,out,depth);
    if(s[i]=='[') return parse_array(s,i,out,depth);
    if(s.compare(i,4,"true")==0){ i+=4; out.v=true; return true; }
    if(s.compare(i,5,"false")==0){ i+=5; out.v=false; return true; }
    if(s.compare(i,4,"null")==0){ i+=4; out.v=JNull{}; return true; }
    double num; if(parse_number(s,i,num)){ out.v=num; return true; }
    return false;
}

bool json_parse(const std::string& s, JNode& out){ size_t i=0; bool ok=parse_value(s,i,out,0); if(!ok) return false; skip(s,i); return i==s.size(); }

static void dump_string(const std::string& str, std::string& o){
    o.push_back('"');
    for(unsigned char c : str){
        switch(c){
            case '"':  o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            case '\b': o += "\\b"; break;
            case '\f': o += "\\f"; break;
            default:
                if(c < 0x20){ char b[8]; std::snprintf(b, sizeof(b), "\\u%04x", c); o += b; }
                else o.push_back((char)c);
        }
    }
    o.push_back('"');
}

static void dump_number(double d, std::string& o){
    char b[32];
    if(std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.0e15){
        std::snprintf(b, sizeof(b), "%lld", (long long)d);
    } else if(std::isfinite(d)) {
        std::snprintf(b, sizeof(b), "%.17g", d);
    } else {
        std::snprintf(b, sizeof(b), "null");
    }
    o += b;
}

static void dump(const JNode& n, std::string& o){
    if(std::holds_alternative<JNull>(n.v)) o+="null";
    else if(std::holds_alternative<bool>(n.v)) o+=(std::get<bool>(n.v)?"true":"false");
    else if(std::holds_alternative<double>(n.v)) dump_number(std::get<double>(n.v), o);
    else if(std::holds_alternative<std::string>(n.v)) dump_string(std::get<std::string>(n.v), o);
    else if(std::holds_alternative<JArr>(n.v)){
        o.push_back('['); const auto& a=std::get<JArr>(n.v);
        for(size_t i=0;i<a.size();++i){ if(i) o.push_back(','); dump(a[i],o); }
        o.push_back(']');
    }
    else {
        o.push_back('{'); const auto& m=std::get<JObj>(n.v); size_t i=0;
        for(auto& kv: m){ if(i++) o.push_back(','); dump_string(kv.first,o); o.push_back(':'); dump(kv.second,o); }
        o.push_back('}');
    }
}
std::string json_dump(const JNode& n){ std::string o; dump(n,o); return o; }

JNode jstr(const std::string& s){ JNode n; n.v=s; return n; }
JNode jnum(double d){ JNode n; n.v=d; return n; }
JNode jbool(bool b){ JNode n; n.v=b; return n; }
JNode jobj(JObj o){ JNode n; n.v=std::move(o); return n; }
JNode jarr(JArr a){ JNode n; n.v=std::move(a); return n; }

bool json_is_obj(const JNode& n){ return std::holds_alternative<JObj>(n.v); }
bool json_is_arr(const JNode& n){ return std::holds_alternative<JArr>(n.v); }

const JNode* json_get(const JNode& obj, const std::string& key){
    if(!json_is_obj(obj)) return nullptr;
    const auto& m = std::get<JObj>(obj.v);
    auto it = m.find(key);
    if(it==m.end()) return nullptr;
    return &it->second;
}

std::string json_as_string(const JNode& n){
    if(std::holds_alternative<std::string>(n.v)) return std::get<std::string>(n.v);
    if(std::holds_alternative<double>(n.v)){ std::string o; dump_number(std::get<double>(n.v), o); return o; }
    if(std::holds_alternative<bool>(n.v)) return std::get<bool>(n.v) ? "true" : "false";
    return "";
}

std::string json_str(const JNode& obj, const std::string& key, const std::string& fallback){
    const JNode* p = json_get(obj, key);
    if(!p || std::holds_alternative<JNull>(p->v)) return fallback;
    if(std::holds_alternative<std::string>(p->v) || std::holds_alternative<double>(p->v)) return json_as_string(*p);
    return fallback;
}

double json_num(const JNode& obj, const std::string& key, double fallback){
    const JNode* p = json_get(obj, key);
    if(!p) return fallback;
    if(std::holds_alternative<double>(p->v)) return std::get<double>(p->v);
    if(std::holds_alternative<std::string>(p->v)){
        const auto& s = std::get<std::string>(p->v);
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if(end && end != s.c_str() && *end == '\0') return d;
    }
    return fallback;
}

int64_t json_int(const JNode& obj, const std::string& key, int64_t fallback){
    const JNode* p = json_get(obj, key);
    if(!p) return fallback;
    if(std::holds_alternative<double>(p->v)) return (int64_t)std::llround(std::get<double>(p->v));
    return (int64_t)std::llround(json_num(obj, key, (double)fallback));
}

bool json_bool(const JNode& obj, const std::string& key, bool fallback){
    const JNode* p = json_get(obj, key);
    if(!p) return fallback;
    if(std::holds_alternative<bool>(p->v)) return std::get<bool>(p->v);
    if(std::holds_alternative<double>(p->v)) return std::get<double>(p->v) != 0.0;
    return fallback;
}
}
