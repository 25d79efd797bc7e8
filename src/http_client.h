#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace mfs {

struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t    port{0};
    std::string path;     // includes the query string, never empty
};

bool parse_url(const std::string& url, Url& out, std::string& err);

using HttpHeaders = std::vector<std::pair<std::string,std::string>>;

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    HttpHeaders headers;
    std::string body;
};

struct HttpResponse {
    int code{0};
    std::string body;
    std::map<std::string,std::string> headers; // lowercased keys
};

// Parses a complete HTTP/1.1 response (status line, headers, body with
// Content-Length, chunked or read-to-close framing).
bool parse_http_response(const std::string& raw, HttpResponse& out, std::string& err);

// Request/response transport. Returns false only when no HTTP response was
// obtained; status codes are left to the caller.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual bool send(const HttpRequest& req, HttpResponse& out, std::string& err) = 0;
};

// One TCP connection per request, TLS via OpenSSL for https URLs.
class SocketHttpTransport : public HttpTransport {
public:
    explicit SocketHttpTransport(int timeout_ms = 60000, bool verify_peer = true)
        : timeout_ms_(timeout_ms), verify_peer_(verify_peer) {}
    ~SocketHttpTransport() override;

    bool send(const HttpRequest& req, HttpResponse& out, std::string& err) override;

private:
    int timeout_ms_;
    bool verify_peer_;
    void* ssl_ctx_{nullptr};  // SSL_CTX*, created on first https request

    bool ensure_ssl_ctx(std::string& err);
};

}
