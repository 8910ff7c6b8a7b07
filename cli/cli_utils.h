#pragma once

#include <istream>
#include <string>

namespace sitenav::cli {

/// Reads the whole stream into memory.
std::string read_all(std::istream& in);
/// Reads HTML from stdin for the default input.
std::string read_stdin();

}  // namespace sitenav::cli
