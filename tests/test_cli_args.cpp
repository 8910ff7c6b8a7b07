#include "test_harness.h"

#include <sstream>
#include <string>
#include <vector>

#include "cli_args.h"

namespace {

void test_parse_cli_args_accepts_stages() {
  const char* argv[] = {
      "sitenav",
      "--stage",
      "tag=li;class=item",
      "--stage",
      "class=price",
      "--input",
      "page.html",
      "--mode",
      "json",
      "--timeout-ms",
      "2500",
      "--verbose",
  };
  int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  sitenav::cli::CliOptions options;
  std::string error;
  bool ok = sitenav::cli::parse_cli_args(argc, const_cast<char**>(argv), options, error);
  expect_true(ok, "parse_cli_args accepts stage flags");
  expect_eq(options.stages.size(), 2, "both stages kept");
  if (options.stages.size() == 2) {
    expect_str_eq(options.stages[0], "tag=li;class=item", "first stage in order");
    expect_str_eq(options.stages[1], "class=price", "second stage in order");
  }
  expect_str_eq(options.input, "page.html", "input parsed");
  expect_str_eq(options.output_mode, "json", "mode parsed");
  expect_eq(static_cast<size_t>(options.timeout_ms), static_cast<size_t>(2500), "timeout parsed");
  expect_true(options.verbose, "verbose parsed");
  expect_true(!options.first && !options.children, "default search mode is cascading");
}

void test_parse_cli_args_rejects_missing_value() {
  const char* argv[] = {
      "sitenav",
      "--stage",
  };
  int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  sitenav::cli::CliOptions options;
  std::string error;
  bool ok = sitenav::cli::parse_cli_args(argc, const_cast<char**>(argv), options, error);
  expect_true(!ok, "missing value is rejected");
  expect_true(error.find("Missing value for --stage") != std::string::npos,
              "missing value has clear error");
}

void test_parse_cli_args_rejects_unknown_argument() {
  const char* argv[] = {
      "sitenav",
      "--stage",
      "div",
      "--unknown",
  };
  int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  sitenav::cli::CliOptions options;
  std::string error;
  bool ok = sitenav::cli::parse_cli_args(argc, const_cast<char**>(argv), options, error);
  expect_true(!ok, "unknown argument is rejected");
  expect_true(error.find("Unknown argument: --unknown") != std::string::npos,
              "unknown argument has clear error");
  expect_true(options.stages.empty(), "options untouched on failure");
}

void test_parse_cli_args_rejects_bad_values() {
  const char* bad_mode[] = {"sitenav", "--mode", "xml"};
  sitenav::cli::CliOptions options;
  std::string error;
  bool ok = sitenav::cli::parse_cli_args(3, const_cast<char**>(bad_mode), options, error);
  expect_true(!ok, "unknown mode is rejected");
  expect_true(error.find("use plain|json") != std::string::npos, "mode error lists choices");

  const char* bad_timeout[] = {"sitenav", "--timeout-ms", "12x"};
  error.clear();
  ok = sitenav::cli::parse_cli_args(3, const_cast<char**>(bad_timeout), options, error);
  expect_true(!ok, "non-numeric timeout is rejected");
  expect_str_eq(error, "Invalid --timeout-ms value: 12x", "timeout error names the value");

  const char* zero_timeout[] = {"sitenav", "--timeout-ms", "0"};
  error.clear();
  ok = sitenav::cli::parse_cli_args(3, const_cast<char**>(zero_timeout), options, error);
  expect_true(!ok, "zero timeout is rejected");
  expect_eq(static_cast<size_t>(options.timeout_ms), static_cast<size_t>(5000),
            "default timeout kept after failure");
}

void test_parse_cli_args_rejects_first_and_children_together() {
  const char* argv[] = {
      "sitenav",
      "--stage",
      "div",
      "--first",
      "--children",
  };
  int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  sitenav::cli::CliOptions options;
  std::string error;
  bool ok = sitenav::cli::parse_cli_args(argc, const_cast<char**>(argv), options, error);
  expect_true(!ok, "first and children together are rejected");
  expect_true(error.find("mutually exclusive") != std::string::npos,
              "mutual exclusion has clear error");
}

void test_parse_cli_args_single_stage_modes() {
  const char* argv[] = {
      "sitenav",
      "--stage",
      "ul",
      "--stage",
      "li",
      "--children",
  };
  int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  sitenav::cli::CliOptions options;
  std::string error;
  bool ok = sitenav::cli::parse_cli_args(argc, const_cast<char**>(argv), options, error);
  expect_true(!ok, "children with two stages is rejected");
  expect_str_eq(error, "--children takes exactly one --stage", "children error");

  const char* first[] = {"sitenav", "--first", "--stage", "a"};
  error.clear();
  ok = sitenav::cli::parse_cli_args(4, const_cast<char**>(first), options, error);
  expect_true(ok, "first with one stage is accepted");
  expect_true(options.first, "first parsed");
}

void test_print_help_lists_flags() {
  std::ostringstream oss;
  sitenav::cli::print_help(oss);
  const std::string help = oss.str();
  expect_true(help.find("--stage") != std::string::npos, "help mentions --stage");
  expect_true(help.find("--first") != std::string::npos, "help mentions --first");
  expect_true(help.find("Exit codes") != std::string::npos, "help lists exit codes");
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parse_cli_args_accepts_stages", test_parse_cli_args_accepts_stages});
  tests.push_back({"parse_cli_args_rejects_missing_value", test_parse_cli_args_rejects_missing_value});
  tests.push_back({"parse_cli_args_rejects_unknown_argument",
                   test_parse_cli_args_rejects_unknown_argument});
  tests.push_back({"parse_cli_args_rejects_bad_values", test_parse_cli_args_rejects_bad_values});
  tests.push_back({"parse_cli_args_rejects_first_and_children_together",
                   test_parse_cli_args_rejects_first_and_children_together});
  tests.push_back({"parse_cli_args_single_stage_modes", test_parse_cli_args_single_stage_modes});
  tests.push_back({"print_help_lists_flags", test_print_help_lists_flags});
}
