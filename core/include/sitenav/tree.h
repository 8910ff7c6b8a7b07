#pragma once

#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "sitenav/errors.h"

namespace sitenav {

/// Per-node decision returned by a traversal visitor.
/// Descend visits the node's children, SkipSubtree prunes them, Halt ends the whole walk.
enum class VisitAction {
  Descend,
  SkipSubtree,
  Halt,
};

/// Reports whether a raw element holds nothing.
/// Values are always present; pointer-like elements are absent when null.
template <typename T>
bool is_absent_element(const T&) {
  return false;
}

template <typename T>
bool is_absent_element(T* const& element) {
  return element == nullptr;
}

template <typename T>
bool is_absent_element(const std::shared_ptr<T>& element) {
  return !element;
}

template <typename T>
class Tree;

/// Wraps one raw element as a traversal unit.
/// MUST keep an absent element representable so visitors can detect it.
/// Children are owned by the node and never change after the tree is built.
template <typename T>
class TreeNode {
 public:
  explicit TreeNode(T data, const TreeNode* parent = nullptr, size_t depth = 0)
      : data_(std::move(data)), parent_(parent), depth_(depth) {}

  TreeNode(const TreeNode&) = delete;
  TreeNode& operator=(const TreeNode&) = delete;

  const T& data() const { return data_; }
  bool has_data() const { return !is_absent_element(data_); }
  const TreeNode* parent() const { return parent_; }
  size_t depth() const { return depth_; }
  bool is_leaf() const { return children_.empty(); }
  const std::vector<std::unique_ptr<TreeNode>>& children() const { return children_; }

 private:
  friend class Tree<T>;

  TreeNode& add_child(T data) {
    children_.push_back(std::make_unique<TreeNode>(std::move(data), this, depth_ + 1));
    return *children_.back();
  }

  T data_;
  const TreeNode* parent_ = nullptr;
  size_t depth_ = 0;
  std::vector<std::unique_ptr<TreeNode>> children_;
};

/// Owns an immutable tree of wrapped elements built from a children producer.
/// MUST have exactly one root and MUST NOT be mutated after build().
/// Move-only; nodes keep stable addresses for the lifetime of the tree.
template <typename T>
class Tree {
 public:
  using Node = TreeNode<T>;
  /// Yields the ordered children of an element; throws on failure.
  using ChildrenFunc = std::function<std::vector<T>(const T&)>;
  using Visitor = std::function<VisitAction(const Node&)>;

  Tree(Tree&&) = default;
  Tree& operator=(Tree&& other) noexcept {
    if (this != &other) {
      release();
      root_ = std::move(other.root_);
      size_ = other.size_;
    }
    return *this;
  }
  ~Tree() { release(); }
  Tree(const Tree&) = delete;
  Tree& operator=(const Tree&) = delete;

  /// Eagerly materializes the tree rooted at `root` by calling `next` on every node.
  /// MUST abort with BuildFailureError on the first producer failure of any type (no partial tree).
  /// Performs no cycle detection: a producer that revisits an ancestor never terminates.
  static Tree build(T root, const ChildrenFunc& next) {
    if (!next) {
      throw std::invalid_argument("children producer must not be empty");
    }
    Tree tree(std::move(root));
    std::deque<Node*> frontier;
    frontier.push_back(tree.root_.get());
    while (!frontier.empty()) {
      Node* current = frontier.front();
      frontier.pop_front();
      std::vector<T> children;
      try {
        children = next(current->data());
      } catch (const std::exception& ex) {
        throw BuildFailureError(std::string("Failed to build tree: ") + ex.what(),
                                std::current_exception());
      } catch (...) {
        throw BuildFailureError("Failed to build tree: unknown producer failure",
                                std::current_exception());
      }
      for (auto& child : children) {
        frontier.push_back(&current->add_child(std::move(child)));
        ++tree.size_;
      }
    }
    return tree;
  }

  const Node& root() const { return *root_; }
  size_t size() const { return size_; }

  std::vector<const Node*> direct_children() const {
    std::vector<const Node*> out;
    out.reserve(root_->children().size());
    for (const auto& child : root_->children()) {
      out.push_back(child.get());
    }
    return out;
  }

  /// Visits nodes level by level starting at the root.
  /// SkipSubtree keeps already-enqueued siblings and cousins; Halt returns immediately.
  void bfs(const Visitor& visitor) const {
    if (!visitor) {
      throw std::invalid_argument("traversal visitor must not be empty");
    }
    std::deque<const Node*> queue;
    queue.push_back(root_.get());
    while (!queue.empty()) {
      const Node* current = queue.front();
      queue.pop_front();
      VisitAction action = visit(visitor, *current);
      if (action == VisitAction::Halt) return;
      if (action == VisitAction::SkipSubtree) continue;
      for (const auto& child : current->children()) {
        queue.push_back(child.get());
      }
    }
  }

  /// Visits nodes in pre-order, children left to right.
  void dfs(const Visitor& visitor) const {
    if (!visitor) {
      throw std::invalid_argument("traversal visitor must not be empty");
    }
    std::vector<const Node*> stack;
    stack.push_back(root_.get());
    while (!stack.empty()) {
      const Node* current = stack.back();
      stack.pop_back();
      VisitAction action = visit(visitor, *current);
      if (action == VisitAction::Halt) return;
      if (action == VisitAction::SkipSubtree) continue;
      const auto& children = current->children();
      for (auto it = children.rbegin(); it != children.rend(); ++it) {
        stack.push_back(it->get());
      }
    }
  }

 private:
  explicit Tree(T root) : root_(std::make_unique<Node>(std::move(root))) {}

  // Engine errors pass through untouched; anything else is a traversal failure.
  static VisitAction visit(const Visitor& visitor, const Node& node) {
    try {
      return visitor(node);
    } catch (const Error&) {
      throw;
    } catch (const std::exception& ex) {
      throw TraversalFailureError(std::string("Traversal visitor failed: ") + ex.what(),
                                  std::current_exception());
    }
  }

  // Unlinks nodes through an explicit worklist so teardown depth does not follow tree depth.
  void release() noexcept {
    std::vector<std::unique_ptr<Node>> pending;
    if (root_) pending.push_back(std::move(root_));
    while (!pending.empty()) {
      std::unique_ptr<Node> node = std::move(pending.back());
      pending.pop_back();
      for (auto& child : node->children_) {
        pending.push_back(std::move(child));
      }
    }
  }

  std::unique_ptr<Node> root_;
  size_t size_ = 1;
};

/// Builds a tree from `root` using the caller's children producer.
template <typename T>
Tree<T> build_tree(T root, const typename Tree<T>::ChildrenFunc& next) {
  return Tree<T>::build(std::move(root), next);
}

}  // namespace sitenav
