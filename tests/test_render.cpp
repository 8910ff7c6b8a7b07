#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "test_harness.h"

#include "render/match_renderer.h"
#include "sitenav/html_document.h"

namespace {

void test_describe_node_variants() {
  sitenav::HtmlDocument doc("render");
  sitenav::HtmlNode* link = doc.append_child(doc.root(), sitenav::HtmlNodeType::Element, "a");
  link->attributes.push_back({"href", "/x"});
  link->attributes.push_back({"class", "nav"});
  sitenav::HtmlNode* text = doc.append_child(link, sitenav::HtmlNodeType::Text, "  Go\n   home ");
  sitenav::HtmlNode* comment = doc.append_child(doc.root(), sitenav::HtmlNodeType::Comment, "c");

  expect_str_eq(sitenav::render::describe_node(*doc.root()), "[0] #document", "document line");
  expect_str_eq(sitenav::render::describe_node(*link), "[1] <a href=\"/x\" class=\"nav\">",
                "element keeps attribute order");
  expect_str_eq(sitenav::render::describe_node(*text), "[2] \"Go home\"", "text is compacted");
  expect_str_eq(sitenav::render::describe_node(*comment), "[3] <!--c-->", "comment line");
}

void test_render_plain_lines() {
  sitenav::HtmlDocument doc("render");
  sitenav::HtmlNode* first = doc.append_child(doc.root(), sitenav::HtmlNodeType::Element, "li");
  sitenav::HtmlNode* second = doc.append_child(doc.root(), sitenav::HtmlNodeType::Element, "li");
  expect_str_eq(sitenav::render::render_plain({}), "(no matches)", "empty result line");
  expect_str_eq(sitenav::render::render_plain({first, second}), "[1] <li>\n[2] <li>",
                "one line per match");
}

void test_render_json_shape() {
  auto doc = sitenav::parse_html("<ul><li class=\"item\" data-id=\"7\">Tea <b>hot</b></li></ul>");
  // html > body > ul > li sits on the first-child chain.
  const sitenav::HtmlNode* li = nullptr;
  for (const sitenav::HtmlNode* node = doc->root(); node != nullptr;) {
    if (node->type == sitenav::HtmlNodeType::Element && node->data == "li") {
      li = node;
      break;
    }
    node = node->first_child;
  }
  expect_true(li != nullptr, "li located");
  if (!li) return;

  auto parsed = nlohmann::json::parse(sitenav::render::render_json({li}));
  expect_true(parsed.is_array(), "json output is an array");
  expect_eq(parsed.size(), 1, "one match");
  const auto& item = parsed.at(0);
  expect_str_eq(item.at("type").get<std::string>(), "element", "type name");
  expect_str_eq(item.at("data").get<std::string>(), "li", "tag name");
  expect_str_eq(item.at("attributes").at("data-id").get<std::string>(), "7", "attribute value");
  expect_str_eq(item.at("text").get<std::string>(), "Tea hot", "compacted inner text");
  expect_eq(static_cast<size_t>(item.at("doc_order").get<int64_t>()),
            static_cast<size_t>(li->doc_order), "document order");

  expect_str_eq(sitenav::render::render_json({}), "[]", "empty result is an empty array");
}

}  // namespace

void register_render_tests(std::vector<TestCase>& tests) {
  tests.push_back({"render_describe_node_variants", test_describe_node_variants});
  tests.push_back({"render_plain_lines", test_render_plain_lines});
  tests.push_back({"render_json_shape", test_render_json_shape});
}
