#pragma once
#include <cstdint>
#include <string>

namespace mfs {

// Milliseconds since the UNIX epoch
int64_t now_ms();

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool starts_with(const std::string& s, const std::string& prefix);

// "1.50 MB" style, base 1024
std::string format_size(uint64_t bytes);

// MIME type sent to the backend: defaults to application/octet-stream and
// carries ";binary" for everything that is not text.
std::string upload_content_type(const std::string& mime);

// Single-transaction uploads always mark the payload ";binary".
std::string direct_content_type(const std::string& mime);

// "/file", or "host:/file" when a file host is configured
std::string metadata_path(const std::string& file_host);

// Percent-encoding for query string values
std::string url_encode(const std::string& s);

}
