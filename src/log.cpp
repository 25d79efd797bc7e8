#include "log.h"
#include <atomic>
#include <mutex>
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <algorithm>
#include <cctype>

namespace mfs {

static std::atomic<LogLevel> g_level{LogLevel::INFO};
static std::atomic<uint32_t> g_categories{static_cast<uint32_t>(LogCategory::ALL)};
static std::atomic<bool> g_timestamps{true};

static std::mutex g_mu;
static std::ofstream g_file;

static const char* level_tag(LogLevel l) {
    switch (l) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::NONE:  break;
    }
    return "";
}

const char* log_category_name(LogCategory cat) {
    switch (cat) {
        case LogCategory::GENERAL: return "general";
        case LogCategory::NET:     return "net";
        case LogCategory::WALLET:  return "wallet";
        case LogCategory::TX:      return "tx";
        case LogCategory::UPLOAD:  return "upload";
        case LogCategory::TASK:    return "task";
        case LogCategory::STORE:   return "store";
        case LogCategory::ALL:     break;
    }
    return "all";
}

// "2024-05-01 12:00:00.123"
static std::string timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, (int)ms);
    return buf;
}

static void write_line(LogLevel lvl, LogCategory cat, const std::string& msg) {
    std::string line;
    line.reserve(msg.size() + 48);
    if (g_timestamps.load(std::memory_order_relaxed)) {
        line += timestamp();
        line += ' ';
    }
    line += '[';
    line += level_tag(lvl);
    line += "][";
    line += log_category_name(cat);
    line += "] ";
    line += msg;
    line += '\n';

    std::lock_guard<std::mutex> lk(g_mu);
    std::cerr << line;
    if (g_file.is_open()) g_file << line;
}

bool log_enabled(LogLevel lvl, LogCategory cat) {
    return g_level.load(std::memory_order_relaxed) <= lvl &&
           (g_categories.load(std::memory_order_relaxed) & static_cast<uint32_t>(cat)) != 0;
}

static void emit(LogLevel lvl, LogCategory cat, const std::string& s) {
    if (log_enabled(lvl, cat)) write_line(lvl, cat, s);
}

void log_info(const std::string& m)  { emit(LogLevel::INFO, LogCategory::GENERAL, m); }
void log_warn(const std::string& m)  { emit(LogLevel::WARN, LogCategory::GENERAL, m); }
void log_error(const std::string& m) { emit(LogLevel::ERR, LogCategory::GENERAL, m); }

void log_trace(LogCategory cat, const std::string& s) { emit(LogLevel::TRACE, cat, s); }
void log_debug(LogCategory cat, const std::string& s) { emit(LogLevel::DEBUG, cat, s); }
void log_info(LogCategory cat, const std::string& s)  { emit(LogLevel::INFO, cat, s); }
void log_warn(LogCategory cat, const std::string& s)  { emit(LogLevel::WARN, cat, s); }
void log_error(LogCategory cat, const std::string& s) { emit(LogLevel::ERR, cat, s); }
void log_fatal(LogCategory cat, const std::string& s) { emit(LogLevel::FATAL, cat, s); }

void log_set_level(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }
void log_set_categories(uint32_t categories) { g_categories.store(categories, std::memory_order_relaxed); }
void log_enable_timestamps(bool enable) { g_timestamps.store(enable, std::memory_order_relaxed); }
LogLevel log_get_level() { return g_level.load(std::memory_order_relaxed); }
uint32_t log_get_categories() { return g_categories.load(std::memory_order_relaxed); }

bool log_parse_level(const std::string& s, LogLevel& out) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (v == "trace") out = LogLevel::TRACE;
    else if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error") out = LogLevel::ERR;
    else if (v == "fatal") out = LogLevel::FATAL;
    else if (v == "none" || v == "off") out = LogLevel::NONE;
    else return false;
    return true;
}

bool log_enable_file(const std::string& filepath) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file.is_open()) g_file.close();
    if (filepath.empty()) return true;
    g_file.open(filepath, std::ios::out | std::ios::app);
    return g_file.is_open();
}

void log_flush() {
    std::lock_guard<std::mutex> lk(g_mu);
    std::cerr.flush();
    if (g_file.is_open()) g_file.flush();
}

void log_init(LogLevel level, uint32_t categories, const std::string& log_file) {
    log_set_level(level);
    log_set_categories(categories);
    if (!log_file.empty() && !log_enable_file(log_file)) {
        write_line(LogLevel::WARN, LogCategory::GENERAL, "cannot open log file " + log_file);
    }
}

void log_shutdown() {
    log_flush();
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file.is_open()) g_file.close();
}

}
