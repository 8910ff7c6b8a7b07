#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "sitenav/sitenav.h"
#include "cli_args.h"
#include "cli_utils.h"
#include "render/match_renderer.h"

using namespace sitenav::cli;

namespace {

std::shared_ptr<const sitenav::HtmlDocument> load_input(const CliOptions& options) {
  if (options.input.empty()) {
    return sitenav::parse_html(read_stdin(), "stdin");
  }
  if (sitenav::is_url(options.input)) {
    return sitenav::load_document_from_url(options.input, options.timeout_ms);
  }
  return sitenav::load_document_from_file(options.input);
}

}  // namespace

/// Entry point that parses CLI options, loads the document and runs the search.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  CliOptions options;
  if (argc == 1) {
    print_help(std::cout);
    return 0;
  }

  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << "Error: " << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "sitenav " << sitenav::version_string() << std::endl;
    return 0;
  }
  if (options.stages.empty()) {
    std::cerr << "Error: at least one --stage is required\n";
    return 2;
  }

  std::vector<sitenav::HtmlCriteria> criteria;
  for (const auto& stage : options.stages) {
    try {
      criteria.push_back(sitenav::parse_criteria(stage));
    } catch (const sitenav::CriteriaParseError& ex) {
      std::cerr << "Error: invalid --stage '" << stage << "': " << ex.what() << std::endl;
      return 2;
    }
  }

  std::shared_ptr<const sitenav::HtmlDocument> doc;
  try {
    doc = load_input(options);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }

  try {
    sitenav::HtmlTree tree(doc->root());
    if (options.verbose) {
      std::cerr << "Loaded " << doc->source_uri() << " (" << tree.tree().size() << " nodes)"
                << std::endl;
    }

    std::vector<const sitenav::HtmlNode*> matches;
    if (options.first) {
      const sitenav::HtmlNode* found = tree.extract_content_from_document(criteria.front());
      if (found) matches.push_back(found);
    } else if (options.children) {
      matches = tree.extract_specific_node(criteria.front());
    } else {
      sitenav::ExtractOptions extract_options;
      if (options.verbose) {
        extract_options.on_stage = [](size_t stage, size_t count) {
          std::cerr << "stage " << stage << ": " << count << " match(es)" << std::endl;
        };
      }
      matches = tree.extract_nodes(criteria, extract_options);
    }

    if (options.output_mode == "json") {
      std::cout << sitenav::render::render_json(matches) << std::endl;
    } else {
      std::cout << sitenav::render::render_plain(matches) << std::endl;
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }
}
