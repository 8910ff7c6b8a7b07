#include "cli_args.h"

#include <stdexcept>
#include <string>

namespace sitenav::cli {

void print_help(std::ostream& os) {
  os << "Usage: sitenav --stage <criteria> [--stage <criteria> ...] [--input <path|url>]\n";
  os << "               [--first | --children] [--mode plain|json] [--timeout-ms <n>]\n";
  os << "               [--verbose]\n";
  os << "       sitenav --help\n";
  os << "       sitenav --version\n";
  os << "If --input is omitted, HTML is read from stdin.\n";
  os << "Each --stage searches below the matches of the previous stage.\n";
  os << "Criteria terms are ';'-separated: tag=div;class=item;attr.href;text='buy now'.\n";
  os << "A bare word is a tag name and '*' matches any node.\n";
  os << "--first returns the first depth-first match of a single stage.\n";
  os << "--children filters the direct children of the document with a single stage.\n";
  os << "URLs are supported when libcurl is available.\n";
  os << "Exit codes: 0=success, 1=runtime error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--stage") {
      if (i + 1 >= argc) {
        error = "Missing value for --stage";
        return false;
      }
      parsed.stages.push_back(argv[++i]);
    } else if (arg == "--input") {
      if (i + 1 >= argc) {
        error = "Missing value for --input";
        return false;
      }
      parsed.input = argv[++i];
    } else if (arg == "--mode") {
      if (i + 1 >= argc) {
        error = "Missing value for --mode";
        return false;
      }
      parsed.output_mode = argv[++i];
      if (parsed.output_mode != "plain" && parsed.output_mode != "json") {
        error = "Invalid --mode value (use plain|json)";
        return false;
      }
    } else if (arg == "--timeout-ms") {
      if (i + 1 >= argc) {
        error = "Missing value for --timeout-ms";
        return false;
      }
      std::string value = argv[++i];
      try {
        size_t idx = 0;
        parsed.timeout_ms = std::stoi(value, &idx);
        if (idx != value.size() || parsed.timeout_ms <= 0) {
          error = "Invalid --timeout-ms value: " + value;
          return false;
        }
      } catch (const std::exception&) {
        error = "Invalid --timeout-ms value: " + value;
        return false;
      }
    } else if (arg == "--first") {
      parsed.first = true;
    } else if (arg == "--children") {
      parsed.children = true;
    } else if (arg == "--verbose") {
      parsed.verbose = true;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (parsed.first && parsed.children) {
    error = "--first and --children are mutually exclusive";
    return false;
  }
  if ((parsed.first || parsed.children) && parsed.stages.size() > 1) {
    error = parsed.first ? "--first takes exactly one --stage" : "--children takes exactly one --stage";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace sitenav::cli
