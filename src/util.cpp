#include "util.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>

namespace mfs {

int64_t now_ms() {
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string trim(const std::string& s) {
    auto a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double v = (double)bytes;
    int u = 0;
    while (v >= 1024.0 && u < 4) { v /= 1024.0; ++u; }
    char buf[32];
    if (u == 0) std::snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
    else std::snprintf(buf, sizeof(buf), "%.2f %s", v, units[u]);
    return buf;
}

std::string upload_content_type(const std::string& mime) {
    std::string ct = trim(mime);
    if (ct.empty()) ct = "application/octet-stream";
    const std::string lower = to_lower(ct);
    if (lower.find(";binary") != std::string::npos) return ct;
    const bool is_text = starts_with(lower, "text/") ||
                         starts_with(lower, "application/json") ||
                         starts_with(lower, "application/javascript") ||
                         starts_with(lower, "application/xml");
    if (is_text) return ct;
    return ct + ";binary";
}

std::string direct_content_type(const std::string& mime) {
    std::string ct = trim(mime);
    if (ct.empty()) ct = "application/octet-stream";
    if (ct.find(";binary") != std::string::npos) return ct;
    return ct + ";binary";
}

std::string metadata_path(const std::string& file_host) {
    std::string host = trim(file_host);
    if (host.empty()) return "/file";
    return host + ":/file";
}

std::string url_encode(const std::string& s) {
    static const char* HEXU = "0123456789ABCDEF";
    std::string o;
    o.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') o.push_back((char)c);
        else { o.push_back('%'); o.push_back(HEXU[c >> 4]); o.push_back(HEXU[c & 15]); }
    }
    return o;
}

bool is_user_cancel_message(const std::string& msg) {
    const std::string m = to_lower(msg);
    return m.find("user cancelled") != std::string::npos ||
           m.find("user canceled") != std::string::npos;
}

}
