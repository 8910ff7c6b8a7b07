#include "render/match_renderer.h"

#include <sstream>

#include <nlohmann/json.hpp>

#include "util/string_util.h"

namespace sitenav::render {

namespace {

std::string describe_element(const HtmlNode& node) {
  std::string out = "<" + node.data;
  for (const auto& attribute : node.attributes) {
    out += " " + attribute.key + "=\"" + attribute.value + "\"";
  }
  out += ">";
  return out;
}

}  // namespace

std::string describe_node(const HtmlNode& node) {
  std::string body;
  switch (node.type) {
    case HtmlNodeType::Document:
      body = "#document";
      break;
    case HtmlNodeType::Element:
      body = describe_element(node);
      break;
    case HtmlNodeType::Text:
      body = "\"" + util::compact_whitespace(node.data) + "\"";
      break;
    case HtmlNodeType::Comment:
      body = "<!--" + node.data + "-->";
      break;
    case HtmlNodeType::Doctype:
      body = "<!DOCTYPE " + node.data + ">";
      break;
  }
  return "[" + std::to_string(node.doc_order) + "] " + body;
}

std::string render_plain(const std::vector<const HtmlNode*>& matches) {
  if (matches.empty()) return "(no matches)";
  std::ostringstream oss;
  for (size_t i = 0; i < matches.size(); ++i) {
    oss << describe_node(*matches[i]);
    if (i + 1 < matches.size()) oss << "\n";
  }
  return oss.str();
}

std::string render_json(const std::vector<const HtmlNode*>& matches) {
  nlohmann::json out = nlohmann::json::array();
  for (const HtmlNode* node : matches) {
    nlohmann::json item;
    item["doc_order"] = node->doc_order;
    item["type"] = node_type_name(node->type);
    item["data"] = node->data;
    nlohmann::json attributes = nlohmann::json::object();
    for (const auto& attribute : node->attributes) {
      attributes[attribute.key] = attribute.value;
    }
    item["attributes"] = attributes;
    item["text"] = util::compact_whitespace(inner_text(*node));
    out.push_back(item);
  }
  return out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace sitenav::render
