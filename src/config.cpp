#include "config.h"
#include "constants.h"
#include "util.h"
#include <fstream>
#include <climits>

using namespace mfs;

Config::Config()
    : api_base(DEFAULT_API_BASE),
      wallet_rpc(DEFAULT_WALLET_RPC),
      task_page_size(DEFAULT_TASK_PAGE_SIZE),
      http_timeout_ms(MFS_HTTP_TIMEOUT_MS) {}

static bool safe_parse_int(const std::string& v, int& out, const std::string& key, int lo, int hi) {
    try {
        long val = std::stol(v);
        if (val < lo || val > hi) {
            log_error("Config: " + key + " value '" + v + "' is out of range");
            return false;
        }
        out = static_cast<int>(val);
        return true;
    } catch (const std::exception& e) {
        log_error("Config: Invalid " + key + " value '" + v + "': " + e.what());
        return false;
    }
}

static bool safe_parse_double(const std::string& v, double& out, const std::string& key) {
    try {
        out = std::stod(v);
        return true;
    } catch (const std::exception& e) {
        log_error("Config: Invalid " + key + " value '" + v + "': " + e.what());
        return false;
    }
}

static std::string strip_trailing_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

bool mfs::apply_config_value(const std::string& key, const std::string& v, Config& out) {
    const std::string k = to_lower(trim(key));
    if (k == "api_base") { out.api_base = strip_trailing_slash(v); return true; }
    if (k == "file_host") { out.file_host = v; return true; }
    if (k == "wallet_rpc") { out.wallet_rpc = strip_trailing_slash(v); return true; }
    if (k == "wallet_token_file") { out.wallet_token_file = v; return true; }
    if (k == "network") {
        if (!parse_network(to_lower(v), out.network)) {
            log_error("Config: Invalid network '" + v + "' (livenet|testnet)");
            return false;
        }
        return true;
    }
    if (k == "fee_rate") return safe_parse_double(v, out.fee_rate, k);
    if (k == "data_dir" || k == "datadir") { out.data_dir = v; return true; }
    if (k == "task_page_size") return safe_parse_int(v, out.task_page_size, k, 1, 100);
    if (k == "http_timeout_ms") return safe_parse_int(v, out.http_timeout_ms, k, 100, INT_MAX);
    if (k == "log_level") {
        if (!log_parse_level(v, out.log_level)) {
            log_error("Config: Invalid log_level '" + v + "'");
            return false;
        }
        return true;
    }
    if (k == "log_file") { out.log_file = v; return true; }
    if (k == "metaid") { out.metaid = v; return true; }
    if (k == "address") { out.address = v; return true; }
    return false;
}

static std::string unquote(const std::string& v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

bool mfs::load_config(const std::string& path, Config& out) {
    std::ifstream in(path);
    if (!in.is_open()) return false;

    std::string raw;
    for (int n = 1; std::getline(in, raw); ++n) {
        const std::string line = trim(raw);
        if (line.empty() || line[0] == '#' || starts_with(line, "//")) continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            log_warn("Config " + path + ":" + std::to_string(n) + ": expected key=value");
            continue;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string val = unquote(trim(line.substr(eq + 1)));
        if (!apply_config_value(key, val, out)) {
            log_warn("Config " + path + ":" + std::to_string(n) + ": ignoring '" + key + "'");
        }
    }
    return true;
}
