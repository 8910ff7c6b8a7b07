#pragma once

#include <string>
#include <vector>

#include "sitenav/html_document.h"

namespace sitenav::render {

/// Renders one node as a single summary line prefixed with its document order.
/// MUST keep attributes in source order and MUST collapse whitespace in text.
std::string describe_node(const HtmlNode& node);
/// Renders matches one per line; "(no matches)" when empty.
std::string render_plain(const std::vector<const HtmlNode*>& matches);
/// Renders matches as a JSON array of node objects.
/// MUST be deterministic for stable golden tests.
std::string render_json(const std::vector<const HtmlNode*>& matches);

}  // namespace sitenav::render
