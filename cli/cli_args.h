#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace sitenav::cli {

/// Command line configuration for one sitenav invocation.
struct CliOptions {
  std::vector<std::string> stages;
  std::string input;
  std::string output_mode = "plain";
  int timeout_ms = 5000;
  bool first = false;
  bool children = false;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
};

/// Prints usage text.
void print_help(std::ostream& os);
/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false with a readable error for invalid flags or flag combinations.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace sitenav::cli
