#include "paths.h"
#include <cerrno>
#include <cstdlib>
#include <string>

#ifdef _WIN32
  #include <windows.h>
  #include <shlobj.h>
  #include <direct.h>
#else
  #include <sys/stat.h>
  #include <sys/types.h>
#endif

namespace mfs {

#ifdef _WIN32
static const char kSep = '\\';
#else
static const char kSep = '/';
#endif

static bool is_sep(char c) { return c == '/' || c == kSep; }

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

static bool is_dir(const std::string& p) {
#ifdef _WIN32
    DWORD attr = GetFileAttributesA(p.c_str());
    return attr != INVALID_FILE_ATTRIBUTES && (attr & FILE_ATTRIBUTE_DIRECTORY);
#else
    struct stat st;
    return stat(p.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
#endif
}

static bool make_one(const std::string& p) {
#ifdef _WIN32
    return _mkdir(p.c_str()) == 0 || errno == EEXIST;
#else
    return mkdir(p.c_str(), 0700) == 0 || errno == EEXIST;
#endif
}

bool ensure_dir(const std::string& path) {
    if (path.empty()) return false;
    if (is_dir(path)) return true;
    for (size_t i = 1; i < path.size(); ++i) {
        if (!is_sep(path[i])) continue;
        const std::string prefix = path.substr(0, i);
        if (!is_dir(prefix) && !make_one(prefix)) return false;
    }
    return make_one(path) && is_dir(path);
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (is_sep(a.back())) return a + b;
    return a + kSep + b;
}

std::string default_data_dir() {
    std::string dir = env_or_empty("MFS_DATA_DIR");
    if (!dir.empty()) return dir;
#ifdef _WIN32
    char appdata[MAX_PATH] = {0};
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, 0, appdata))) return join_path(appdata, "MfsUploader");
    return "MfsUploader";
#else
    std::string home = env_or_empty("HOME");
    if (home.empty()) home = ".";
  #ifdef __APPLE__
    return join_path(home, "Library/Application Support/MfsUploader");
  #else
    const std::string xdg = env_or_empty("XDG_DATA_HOME");
    if (!xdg.empty()) return join_path(xdg, "mfsuploader");
    return join_path(home, ".mfsuploader");
  #endif
#endif
}

}
