#pragma once

#include <vector>

#include "sitenav/html_document.h"
#include "sitenav/search.h"
#include "sitenav/tree.h"

namespace sitenav {

using HtmlCriteria = SearchCriteria<const HtmlNode*>;
using HtmlNodeTree = Tree<const HtmlNode*>;

/// Children producer for HTML documents.
/// MUST throw NilParameterError for a null node so an invalid input is never
/// mistaken for a leaf.
std::vector<const HtmlNode*> html_children(const HtmlNode* const& node);

/// Tree view over an HTML subtree with the single- and multi-stage searches.
/// The document that owns `root` MUST outlive the HtmlTree.
class HtmlTree {
 public:
  /// Builds the full tree below `root`; throws BuildFailureError when `root` is null.
  explicit HtmlTree(const HtmlNode* root);

  const HtmlNodeTree& tree() const { return tree_; }
  const HtmlNode* root() const { return tree_.root().data(); }

  /// Direct children of the root that match `criteria`.
  std::vector<const HtmlNode*> extract_specific_node(const HtmlCriteria& criteria) const;
  /// Shallowest matches of each branch, breadth-first; matched subtrees are not searched.
  std::vector<const HtmlNode*> match_nodes(const HtmlCriteria& criteria) const;
  /// First depth-first match, or nullptr when nothing matches.
  const HtmlNode* extract_content_from_document(const HtmlCriteria& criteria) const;
  /// Cascading search: each stage searches below the previous stage's matches.
  std::vector<const HtmlNode*> extract_nodes(const std::vector<HtmlCriteria>& criteria,
                                             const ExtractOptions& options = {}) const;

 private:
  HtmlNodeTree tree_;
};

}  // namespace sitenav
