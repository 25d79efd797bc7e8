// =============================================================================
// LOGGING
// Lines go to stderr (stdout is reserved for command output) and, when
// configured, are mirrored into a log file.
// =============================================================================

#pragma once
#include <string>
#include <cstdint>

namespace mfs {

// ERR rather than ERROR: windows.h defines ERROR
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    NONE = 6
};

enum class LogCategory : uint32_t {
    GENERAL = 0x0001,
    NET     = 0x0002,
    WALLET  = 0x0004,
    TX      = 0x0008,
    UPLOAD  = 0x0010,
    TASK    = 0x0020,
    STORE   = 0x0040,
    ALL     = 0xFFFF
};

const char* log_category_name(LogCategory cat);

void log_set_level(LogLevel level);
void log_set_categories(uint32_t categories);
void log_enable_timestamps(bool enable);
// Appends every line to `filepath`. Empty path closes the file.
bool log_enable_file(const std::string& filepath);

LogLevel log_get_level();
uint32_t log_get_categories();
bool log_enabled(LogLevel level, LogCategory cat);

// trace, debug, info, warn(ing), error, fatal, none/off
bool log_parse_level(const std::string& s, LogLevel& out);

// GENERAL category
void log_info(const std::string& s);
void log_warn(const std::string& s);
void log_error(const std::string& s);

void log_trace(LogCategory cat, const std::string& s);
void log_debug(LogCategory cat, const std::string& s);
void log_info(LogCategory cat, const std::string& s);
void log_warn(LogCategory cat, const std::string& s);
void log_error(LogCategory cat, const std::string& s);
void log_fatal(LogCategory cat, const std::string& s);

// Skips building `msg` when the level or category is filtered out.
#define MFS_LOG_AT(lvl, fn, cat, msg) do { \
    if (mfs::log_enabled(mfs::LogLevel::lvl, cat)) mfs::fn(cat, msg); \
} while(0)

#define MFS_LOG_TRACE(cat, msg) MFS_LOG_AT(TRACE, log_trace, cat, msg)
#define MFS_LOG_DEBUG(cat, msg) MFS_LOG_AT(DEBUG, log_debug, cat, msg)

void log_flush();

void log_init(LogLevel level = LogLevel::INFO,
              uint32_t categories = static_cast<uint32_t>(LogCategory::ALL),
              const std::string& log_file = "");

void log_shutdown();

}
