#include "cli_utils.h"

#include <iostream>
#include <sstream>

namespace sitenav::cli {

std::string read_all(std::istream& in) {
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  return read_all(std::cin);
}

}  // namespace sitenav::cli
