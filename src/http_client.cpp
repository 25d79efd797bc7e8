#include "http_client.h"
#include "constants.h"
#include "log.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#ifdef _WIN32
  #ifndef NOMINMAX
  #define NOMINMAX 1
  #endif
  #define _WINSOCK_DEPRECATED_NO_WARNINGS
  #include <winsock2.h>
  #include <ws2tcpip.h>
  #pragma comment(lib, "Ws2_32.lib")
  using socklen_t = int;
  using sock_t = SOCKET;
  static const sock_t BAD_SOCK = INVALID_SOCKET;
  static bool wsa_inited = false;
  static void wsa_ensure(){ if(!wsa_inited){ WSADATA w; WSAStartup(MAKEWORD(2,2), &w); wsa_inited=true; } }
#else
  #include <sys/types.h>
  #include <sys/socket.h>
  #include <sys/time.h>
  #include <netdb.h>
  #include <unistd.h>
  #include <arpa/inet.h>
  using sock_t = int;
  static const sock_t BAD_SOCK = -1;
  #define closesocket ::close
#endif

#include <openssl/ssl.h>
#include <openssl/err.h>

namespace mfs {

static inline std::string lc(std::string s){
    for(char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool parse_url(const std::string& url, Url& out, std::string& err){
    size_t p = url.find("://");
    if(p==std::string::npos){ err = "invalid url (no scheme): " + url; return false; }
    out.scheme = lc(url.substr(0,p));
    if(out.scheme!="http" && out.scheme!="https"){ err = "unsupported url scheme: " + out.scheme; return false; }
    std::string rest = url.substr(p+3);
    size_t slash = rest.find('/');
    std::string hostport = slash==std::string::npos ? rest : rest.substr(0,slash);
    out.path = slash==std::string::npos ? "/" : rest.substr(slash);
    size_t q = out.path.find('#');
    if(q!=std::string::npos) out.path.resize(q);
    if(out.path.empty()) out.path = "/";

    out.port = out.scheme=="https" ? 443 : 80;
    if(!hostport.empty() && hostport[0]=='['){
        size_t rb = hostport.find(']');
        if(rb==std::string::npos){ err = "invalid IPv6 host in url"; return false; }
        out.host = hostport.substr(1, rb-1);
        hostport = hostport.substr(rb+1);
        if(!hostport.empty() && hostport[0]!=':'){ err = "invalid url authority"; return false; }
        if(!hostport.empty()) hostport = "x" + hostport;
    }
    size_t colon = hostport.rfind(':');
    if(colon!=std::string::npos){
        std::string ps = hostport.substr(colon+1);
        if(ps.empty() || ps.size()>5 || !std::all_of(ps.begin(), ps.end(), [](unsigned char c){ return std::isdigit(c)!=0; })){
            err = "invalid port in url: " + url; return false;
        }
        long v = std::strtol(ps.c_str(), nullptr, 10);
        if(v<=0 || v>65535){ err = "invalid port in url: " + url; return false; }
        out.port = (uint16_t)v;
        if(out.host.empty()) out.host = hostport.substr(0,colon);
    } else if(out.host.empty()) {
        out.host = hostport;
    }
    if(out.host.empty()){ err = "missing host in url: " + url; return false; }
    return true;
}

static bool decode_chunked(const std::string& in, std::string& out){
    out.clear();
    size_t pos = 0;
    for(;;){
        size_t nl = in.find("\r\n", pos);
        if(nl==std::string::npos) return false;
        std::string szs = in.substr(pos, nl-pos);
        size_t semi = szs.find(';');
        if(semi!=std::string::npos) szs.resize(semi);
        char* end = nullptr;
        unsigned long long sz = std::strtoull(szs.c_str(), &end, 16);
        if(end==szs.c_str()) return false;
        pos = nl+2;
        if(sz==0) return true;
        if(sz > in.size()-pos) return false;
        out.append(in, pos, (size_t)sz);
        pos += (size_t)sz;
        if(in.compare(pos, 2, "\r\n")!=0) return false;
        pos += 2;
    }
}

bool parse_http_response(const std::string& buf, HttpResponse& out, std::string& err){
    size_t pos = buf.find("\r\n");
    if(pos==std::string::npos){ err = "http: malformed status line"; return false; }
    std::string status = buf.substr(0,pos);
    if(status.compare(0,5,"HTTP/")!=0){ err = "http: malformed status line"; return false; }
    int code = 0;
    {
        size_t sp = status.find(' ');
        if(sp!=std::string::npos) code = std::atoi(status.c_str()+sp+1);
    }
    if(code<100){ err = "http: bad status code"; return false; }

    size_t hdr_end = buf.find("\r\n\r\n");
    if(hdr_end==std::string::npos){ err = "http: truncated headers"; return false; }
    std::map<std::string,std::string> hdrs;
    size_t cur = pos+2;
    while(cur < hdr_end){
        size_t nl = buf.find("\r\n", cur);
        if(nl==std::string::npos || nl>hdr_end) nl = hdr_end;
        std::string line = buf.substr(cur, nl-cur);
        cur = nl+2;
        size_t c = line.find(':');
        if(c!=std::string::npos){
            std::string k = lc(line.substr(0,c));
            std::string v = line.substr(c+1);
            while(!v.empty() && (v.front()==' '||v.front()=='\t')) v.erase(v.begin());
            while(!v.empty() && (v.back()==' '||v.back()=='\t')) v.pop_back();
            hdrs[k] = v;
        }
    }

    std::string body = buf.substr(hdr_end+4);
    auto te = hdrs.find("transfer-encoding");
    auto cl = hdrs.find("content-length");
    if(te!=hdrs.end() && lc(te->second).find("chunked")!=std::string::npos){
        std::string dec;
        if(!decode_chunked(body, dec)){ err = "http: bad chunked body"; return false; }
        body.swap(dec);
    } else if(cl!=hdrs.end()){
        unsigned long long n = std::strtoull(cl->second.c_str(), nullptr, 10);
        if(n > body.size()){ err = "http: truncated body"; return false; }
        body.resize((size_t)n);
    }

    out.code = code;
    out.body = std::move(body);
    out.headers = std::move(hdrs);
    return true;
}

static bool set_timeout(sock_t fd, int ms){
#ifdef _WIN32
    DWORD tv = (DWORD)ms;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv))==0
        && setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, (const char*)&tv, sizeof(tv))==0;
#else
    timeval tv; tv.tv_sec = ms/1000; tv.tv_usec = (ms%1000)*1000;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv))==0
        && setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv))==0;
#endif
}

static sock_t connect_tcp(const std::string& host, uint16_t port, int timeout_ms, std::string& err){
#ifdef _WIN32
    wsa_ensure();
#endif
    addrinfo hints{}; hints.ai_family=AF_UNSPEC; hints.ai_socktype=SOCK_STREAM;
    char portbuf[16]; std::snprintf(portbuf, sizeof(portbuf), "%u", (unsigned)port);
    addrinfo* res=nullptr;
    if(getaddrinfo(host.c_str(), portbuf, &hints, &res)!=0){ err = "cannot resolve " + host; return BAD_SOCK; }

    sock_t fd = BAD_SOCK;
    for(addrinfo* ai=res; ai; ai=ai->ai_next){
        fd = (sock_t)socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if(fd==BAD_SOCK) continue;
        if(!set_timeout(fd, timeout_ms)){ closesocket(fd); fd = BAD_SOCK; continue; }
        if(connect(fd, ai->ai_addr, (socklen_t)ai->ai_addrlen)==0) break;
        closesocket(fd);
        fd = BAD_SOCK;
    }
    freeaddrinfo(res);
    if(fd==BAD_SOCK) err = "cannot connect to " + host + ":" + std::to_string(port);
    return fd;
}

// Owns the socket and, for https, the SSL session on top of it.
struct Conn {
    sock_t fd{BAD_SOCK};
    SSL* ssl{nullptr};

    ~Conn(){
        if(ssl){ SSL_shutdown(ssl); SSL_free(ssl); }
        if(fd!=BAD_SOCK) closesocket(fd);
    }

    bool write_all(const char* p, size_t left){
        while(left){
            int n;
            if(ssl) n = SSL_write(ssl, p, (int)std::min<size_t>(left, 1u<<20));
            else n = (int)::send(fd, p, (int)std::min<size_t>(left, 1u<<20), 0);
            if(n<=0) return false;
            p += n; left -= (size_t)n;
        }
        return true;
    }

    // -1 on error, 0 on orderly close
    int read_some(char* buf, int cap){
        if(ssl){
            int r = SSL_read(ssl, buf, cap);
            if(r>0) return r;
            int e = SSL_get_error(ssl, r);
            return (e==SSL_ERROR_ZERO_RETURN) ? 0 : -1;
        }
        return (int)::recv(fd, buf, cap, 0);
    }
};

static std::string ssl_error_string(){
    unsigned long e = ERR_get_error();
    if(!e) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    return buf;
}

SocketHttpTransport::~SocketHttpTransport(){
    if(ssl_ctx_) SSL_CTX_free(static_cast<SSL_CTX*>(ssl_ctx_));
}

bool SocketHttpTransport::ensure_ssl_ctx(std::string& err){
    if(ssl_ctx_) return true;
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if(!ctx){ err = "TLS: SSL_CTX_new failed"; return false; }
#ifdef TLS1_2_VERSION
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
#endif
    SSL_CTX_set_options(ctx, SSL_OP_NO_COMPRESSION);
    if(verify_peer_){
        if(SSL_CTX_set_default_verify_paths(ctx)!=1){
            err = "TLS: cannot load default CA paths";
            SSL_CTX_free(ctx);
            return false;
        }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    }
    ssl_ctx_ = ctx;
    return true;
}

bool SocketHttpTransport::send(const HttpRequest& req, HttpResponse& out, std::string& err){
    Url u;
    if(!parse_url(req.url, u, err)) return false;

    Conn c;
    c.fd = connect_tcp(u.host, u.port, timeout_ms_, err);
    if(c.fd==BAD_SOCK) return false;

    if(u.scheme=="https"){
        if(!ensure_ssl_ctx(err)) return false;
        c.ssl = SSL_new(static_cast<SSL_CTX*>(ssl_ctx_));
        if(!c.ssl){ err = "TLS: SSL_new failed"; return false; }
        SSL_set_fd(c.ssl, (int)c.fd);
        SSL_set_tlsext_host_name(c.ssl, u.host.c_str());
        if(verify_peer_) SSL_set1_host(c.ssl, u.host.c_str());
        if(SSL_connect(c.ssl)<=0){
            err = "TLS handshake with " + u.host + " failed: " + ssl_error_string();
            return false;
        }
    }

    std::string head;
    head.reserve(256);
    head += req.method + " " + u.path + " HTTP/1.1\r\n";
    head += "Host: " + u.host;
    if(!((u.scheme=="http" && u.port==80) || (u.scheme=="https" && u.port==443))) head += ":" + std::to_string(u.port);
    head += "\r\n";
    bool has_ct = false;
    for(const auto& h: req.headers){
        if(lc(h.first)=="content-type") has_ct = true;
        head += h.first; head += ": "; head += h.second; head += "\r\n";
    }
    if(!req.body.empty() || req.method=="POST"){
        if(!has_ct) head += "Content-Type: application/json\r\n";
        head += "Content-Length: " + std::to_string(req.body.size()) + "\r\n";
    }
    head += "Accept: application/json\r\n";
    head += "Connection: close\r\n\r\n";

    if(!c.write_all(head.data(), head.size()) || !c.write_all(req.body.data(), req.body.size())){
        err = "send to " + u.host + " failed";
        return false;
    }

    std::string buf; buf.reserve(4096);
    char tmp[16384];
    for(;;){
        int n = c.read_some(tmp, (int)sizeof(tmp));
        if(n<0){
            if(buf.empty()){ err = "no response from " + u.host + " (timeout or reset)"; return false; }
            break;
        }
        if(n==0) break;
        buf.append(tmp, tmp+n);
        if(buf.size() > MFS_HTTP_MAX_BODY){ err = "http: response too large"; return false; }
    }

    if(!parse_http_response(buf, out, err)) return false;
    log_trace(LogCategory::NET, req.method + " " + req.url + " -> " + std::to_string(out.code) +
              " (" + std::to_string(out.body.size()) + " bytes)");
    return true;
}

}
