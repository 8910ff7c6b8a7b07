#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sitenav/errors.h"
#include "sitenav/tree.h"

namespace sitenav {

/// Boolean test over a raw element, or one of two sentinel states.
/// Absent means "not supplied": single-predicate searches treat it as Wildcard,
/// while extract_nodes drops it. Wildcard matches every element.
/// MUST be stateless so one value can be reused across stages and calls.
template <typename T>
class SearchCriteria {
 public:
  enum class Kind { Absent, Wildcard, Predicate };
  using PredicateFunc = std::function<bool(const T&)>;

  SearchCriteria() = default;
  // An empty function yields an Absent criteria.
  SearchCriteria(PredicateFunc predicate)
      : kind_(predicate ? Kind::Predicate : Kind::Absent), predicate_(std::move(predicate)) {}

  static SearchCriteria wildcard() {
    SearchCriteria out;
    out.kind_ = Kind::Wildcard;
    return out;
  }

  Kind kind() const { return kind_; }
  bool is_absent() const { return kind_ == Kind::Absent; }

  bool matches(const T& element) const {
    if (kind_ != Kind::Predicate) return true;
    return predicate_(element);
  }

 private:
  Kind kind_ = Kind::Absent;
  PredicateFunc predicate_;
};

/// Hooks for observing a cascading search while it runs.
struct ExtractOptions {
  /// Called once per evaluated stage with its 1-based index and match count.
  std::function<void(size_t stage, size_t matches)> on_stage;
};

namespace search_internal {

template <typename T>
const T& checked_data(const TreeNode<T>& node) {
  if (!node.has_data()) {
    throw NilParameterError("node.data");
  }
  return node.data();
}

}  // namespace search_internal

/// Filters the root's immediate children without recursing.
/// Returns matches in child order; empty when the root is a leaf.
template <typename T>
std::vector<T> direct_children_matching(const Tree<T>& tree, const SearchCriteria<T>& criteria) {
  std::vector<T> out;
  for (const auto* child : tree.direct_children()) {
    const T& element = search_internal::checked_data(*child);
    if (criteria.matches(element)) {
      out.push_back(element);
    }
  }
  return out;
}

/// Breadth-first search below the root that stops descending at every match.
/// Returns the shallowest match of each branch in BFS order, so no result is an
/// ancestor of another. Throws NilParameterError on a node without an element.
template <typename T>
std::vector<T> collect_and_prune(const Tree<T>& tree, const SearchCriteria<T>& criteria) {
  std::vector<T> solution;
  const TreeNode<T>* root = &tree.root();
  tree.bfs([&](const TreeNode<T>& node) {
    if (&node == root) return VisitAction::Descend;
    const T& element = search_internal::checked_data(node);
    if (!criteria.matches(element)) {
      return VisitAction::Descend;
    }
    solution.push_back(element);
    return VisitAction::SkipSubtree;
  });
  return solution;
}

/// Depth-first (pre-order) search below the root for the first matching element.
/// Halts the whole walk on the first match; nullopt when nothing matches.
template <typename T>
std::optional<T> first_match(const Tree<T>& tree, const SearchCriteria<T>& criteria) {
  std::optional<T> solution;
  const TreeNode<T>* root = &tree.root();
  tree.dfs([&](const TreeNode<T>& node) {
    if (&node == root) return VisitAction::Descend;
    const T& element = search_internal::checked_data(node);
    if (!criteria.matches(element)) {
      return VisitAction::Descend;
    }
    solution = element;
    return VisitAction::Halt;
  });
  return solution;
}

/// Cascading search starting from an already built tree.
/// Stage i runs collect_and_prune on every tree of the working set; each match then
/// becomes the root of a fresh tree for stage i + 1. A stage without matches ends
/// the search with an empty result and later stages are never evaluated.
/// MUST drop Absent criteria and MUST return empty when none remain.
/// Build failures carry the 1-based stage and element ordinal.
template <typename T>
std::vector<T> extract_nodes_from(const Tree<T>& tree,
                                  const typename Tree<T>::ChildrenFunc& next,
                                  const std::vector<SearchCriteria<T>>& criteria,
                                  const ExtractOptions& options = {}) {
  std::vector<const SearchCriteria<T>*> stages;
  for (const auto& item : criteria) {
    if (!item.is_absent()) stages.push_back(&item);
  }
  if (stages.empty()) return {};

  std::vector<Tree<T>> owned;
  std::vector<const Tree<T>*> todo = {&tree};

  for (size_t i = 0; i < stages.size(); ++i) {
    const size_t stage = i + 1;
    std::vector<T> matches;
    for (const auto* current : todo) {
      std::vector<T> result;
      try {
        result = collect_and_prune(*current, *stages[i]);
      } catch (const Error& ex) {
        throw TraversalFailureError("Error while applying criteria " + std::to_string(stage) +
                                        ": " + ex.what(),
                                    std::current_exception());
      }
      matches.insert(matches.end(), result.begin(), result.end());
    }
    if (options.on_stage) options.on_stage(stage, matches.size());
    if (matches.empty()) return {};

    std::vector<Tree<T>> next_trees;
    next_trees.reserve(matches.size());
    for (size_t j = 0; j < matches.size(); ++j) {
      try {
        next_trees.push_back(Tree<T>::build(matches[j], next));
      } catch (const BuildFailureError& ex) {
        throw BuildFailureError("Error while adding tree " + std::to_string(j + 1) +
                                    " at criteria " + std::to_string(stage) + ": " + ex.what(),
                                ex.cause(), stage, j + 1);
      }
    }
    owned = std::move(next_trees);
    todo.clear();
    for (const auto& item : owned) {
      todo.push_back(&item);
    }
  }

  std::vector<T> solution;
  solution.reserve(todo.size());
  for (const auto* current : todo) {
    solution.push_back(current->root().data());
  }
  return solution;
}

/// Builds the tree rooted at `root` and runs the cascading search over it.
/// No tree is built when every criteria is Absent.
template <typename T>
std::vector<T> extract_nodes(const T& root,
                             const typename Tree<T>::ChildrenFunc& next,
                             const std::vector<SearchCriteria<T>>& criteria,
                             const ExtractOptions& options = {}) {
  bool any_stage = false;
  for (const auto& item : criteria) {
    if (!item.is_absent()) {
      any_stage = true;
      break;
    }
  }
  if (!any_stage) return {};
  Tree<T> tree = Tree<T>::build(root, next);
  return extract_nodes_from(tree, next, criteria, options);
}

}  // namespace sitenav
