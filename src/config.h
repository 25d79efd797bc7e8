#pragma once
#include <string>
#include <cstdint>

#include "address.h"
#include "log.h"

namespace mfs {

struct Config {
    std::string api_base;               // backend root, endpoints are appended
    std::string file_host;              // optional "host:" prefix of the metadata path
    std::string wallet_rpc;             // JSON-RPC wallet daemon URL
    std::string wallet_token_file;      // bearer token cookie; env MFS_WALLET_TOKEN wins
    Network     network = Network::Livenet;
    double      fee_rate = 1.0;         // sat/byte; <= 0 falls back to 1
    std::string data_dir;               // empty = default_data_dir()
    int         task_page_size = 10;
    int         http_timeout_ms = 60000;
    LogLevel    log_level = LogLevel::INFO;
    std::string log_file;
    std::string metaid;
    std::string address;

    Config();
};

// key=value lines, "#" and "//" comments, optional quotes around values.
// Unknown keys and bad values are logged and skipped. False if the file cannot be read.
bool load_config(const std::string& path, Config& out);

// Applies one setting; false for an unknown key or an unusable value.
bool apply_config_value(const std::string& key, const std::string& value, Config& out);

}
