#include <string>
#include <utility>
#include <vector>

#include "test_harness.h"

#include "sitenav/errors.h"
#include "sitenav/html_criteria.h"
#include "sitenav/html_document.h"
#include "sitenav/html_tree.h"

namespace {

const char* kProductList =
    "<html><body><ul id=\"products\">"
    "<li class=\"item\"><span class=\"name\">Apple</span><span class=\"price\">1</span></li>"
    "<li class=\"item sale\"><span class=\"name\">Pear</span><span class=\"price\">2</span></li>"
    "<li class=\"ad\"><span class=\"price\">9</span></li>"
    "</ul></body></html>";

std::string join_text(const std::vector<const sitenav::HtmlNode*>& nodes) {
  std::string out;
  for (size_t i = 0; i < nodes.size(); ++i) {
    if (i > 0) out += ",";
    out += sitenav::inner_text(*nodes[i]);
  }
  return out;
}

void test_html_children_rejects_null() {
  bool threw = false;
  try {
    sitenav::html_children(nullptr);
  } catch (const sitenav::NilParameterError&) {
    threw = true;
  }
  expect_true(threw, "null node is not a leaf");

  bool build_threw = false;
  try {
    sitenav::HtmlTree tree(nullptr);
  } catch (const sitenav::BuildFailureError&) {
    build_threw = true;
  }
  expect_true(build_threw, "tree over a null root fails to build");
}

void test_match_text_nodes() {
  auto doc = sitenav::parse_html("<div><p>Hello <b>World</b></p></div>");
  sitenav::HtmlTree whole(doc->root());
  const sitenav::HtmlNode* p = whole.extract_content_from_document(sitenav::parse_criteria("p"));
  expect_true(p != nullptr, "paragraph found");
  if (!p) return;

  sitenav::HtmlTree paragraph(p);
  expect_true(paragraph.root() == p, "tree root is the paragraph");
  auto texts = paragraph.match_nodes(sitenav::is_text_node_search());
  expect_eq(texts.size(), 2, "two text nodes below the paragraph");
  expect_str_eq(join_text(texts), "Hello ,World", "text nodes in breadth-first order");
}

void test_extract_nodes_product_list() {
  auto doc = sitenav::parse_html(kProductList);
  sitenav::HtmlTree tree(doc->root());

  std::vector<std::pair<size_t, size_t>> stages;
  sitenav::ExtractOptions options;
  options.on_stage = [&stages](size_t stage, size_t matches) { stages.emplace_back(stage, matches); };

  auto prices = tree.extract_nodes(
      {sitenav::parse_criteria("tag=li;class=item"), sitenav::parse_criteria("class=price")}, options);
  expect_str_eq(join_text(prices), "1,2", "prices of item rows only");
  expect_eq(stages.size(), 2, "both stages reported");
  if (stages.size() == 2) {
    expect_eq(stages[0].second, 2, "two item rows");
    expect_eq(stages[1].second, 2, "one price per row");
  }

  auto sale = tree.extract_nodes({sitenav::parse_criteria("li;class=sale"),
                                  sitenav::parse_criteria("class=name")});
  expect_str_eq(join_text(sale), "Pear", "class token match narrows to the sale row");

  auto none = tree.extract_nodes({sitenav::parse_criteria("tag=table"), sitenav::parse_criteria("*")});
  expect_true(none.empty(), "missing first stage yields empty");
}

void test_match_nodes_prunes_nested_matches() {
  auto doc = sitenav::parse_html(
      "<div class=\"c\" id=\"outer\"><div class=\"c\" id=\"inner\">x</div></div>"
      "<div class=\"c\" id=\"second\">y</div>");
  sitenav::HtmlTree tree(doc->root());
  auto matches = tree.match_nodes(sitenav::parse_criteria("class=c"));
  expect_eq(matches.size(), 2, "nested match is pruned");
  if (matches.size() == 2) {
    expect_str_eq(*sitenav::get_attribute(*matches[0], "id"), "outer", "outer div first");
    expect_str_eq(*sitenav::get_attribute(*matches[1], "id"), "second", "sibling div kept");
  }
}

void test_first_and_direct_children() {
  auto doc = sitenav::parse_html(kProductList);
  sitenav::HtmlTree tree(doc->root());

  const sitenav::HtmlNode* name = tree.extract_content_from_document(sitenav::parse_criteria("class=name"));
  expect_true(name != nullptr, "first name found");
  if (name) {
    expect_str_eq(sitenav::inner_text(*name), "Apple", "depth-first match is the first row");
  }
  expect_true(tree.extract_content_from_document(sitenav::parse_criteria("tag=table")) == nullptr,
              "no match yields nullptr");

  const sitenav::HtmlNode* list = tree.extract_content_from_document(sitenav::parse_criteria("id=products"));
  expect_true(list != nullptr, "list found");
  if (!list) return;
  sitenav::HtmlTree rows(list);
  expect_eq(rows.extract_specific_node(sitenav::parse_criteria("li")).size(), 3, "three rows");
  expect_eq(rows.extract_specific_node(sitenav::parse_criteria("class=price")).size(), 0,
            "grandchildren are not direct children");
  expect_eq(rows.tree().size(), 14, "list subtree size");
}

}  // namespace

void register_html_tree_tests(std::vector<TestCase>& tests) {
  tests.push_back({"html_tree_children_rejects_null", test_html_children_rejects_null});
  tests.push_back({"html_tree_match_text_nodes", test_match_text_nodes});
  tests.push_back({"html_tree_extract_nodes_product_list", test_extract_nodes_product_list});
  tests.push_back({"html_tree_match_nodes_prunes_nested_matches", test_match_nodes_prunes_nested_matches});
  tests.push_back({"html_tree_first_and_direct_children", test_first_and_direct_children});
}
