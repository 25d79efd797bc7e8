#pragma once
#include <string>

namespace mfs {

// Writable directory for session state, first match wins:
//   $MFS_DATA_DIR
//   Windows: %APPDATA%\MfsUploader
//   macOS:   $HOME/Library/Application Support/MfsUploader
//   other:   $XDG_DATA_HOME/mfsuploader, else $HOME/.mfsuploader
std::string default_data_dir();

// mkdir -p with owner-only permissions on the last component.
bool ensure_dir(const std::string& path);

std::string join_path(const std::string& a, const std::string& b);

}
