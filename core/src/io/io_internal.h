#pragma once

#include <string>

namespace sitenav::io_internal {

/// Loads file contents as raw bytes.
/// MUST throw on IO errors and MUST not perform network access.
std::string read_file(const std::string& path);
/// Fetches URL content when libcurl support is compiled in.
/// MUST honor timeout_ms and MUST throw on transfer or Content-Type failures.
std::string fetch_url(const std::string& url, int timeout_ms);

}  // namespace sitenav::io_internal
