#include "sitenav/html_tree.h"

#include "sitenav/errors.h"

namespace sitenav {

std::vector<const HtmlNode*> html_children(const HtmlNode* const& node) {
  if (node == nullptr) {
    throw NilParameterError("node");
  }
  return get_direct_children(node);
}

HtmlTree::HtmlTree(const HtmlNode* root)
    : tree_(build_tree(root, HtmlNodeTree::ChildrenFunc(html_children))) {}

std::vector<const HtmlNode*> HtmlTree::extract_specific_node(const HtmlCriteria& criteria) const {
  return direct_children_matching(tree_, criteria);
}

std::vector<const HtmlNode*> HtmlTree::match_nodes(const HtmlCriteria& criteria) const {
  return collect_and_prune(tree_, criteria);
}

const HtmlNode* HtmlTree::extract_content_from_document(const HtmlCriteria& criteria) const {
  auto found = first_match(tree_, criteria);
  return found.has_value() ? *found : nullptr;
}

std::vector<const HtmlNode*> HtmlTree::extract_nodes(const std::vector<HtmlCriteria>& criteria,
                                                     const ExtractOptions& options) const {
  return extract_nodes_from(tree_, HtmlNodeTree::ChildrenFunc(html_children), criteria, options);
}

}  // namespace sitenav
