#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "sitenav/tree.h"

namespace sitenav {

/// Weighted adjacency matrix over a fixed vertex list.
/// Vertices are compared with operator==; edges are directed and a missing edge is nullopt.
/// Provides lookups only; search trees come from make_tree().
template <typename T>
class WeightedGraph {
 public:
  /// Returns the weight of the edge from -> to, or nullopt when there is none.
  using WeightFunc = std::function<std::optional<double>(const T& from, const T& to)>;

  WeightedGraph() = default;

  /// Evaluates `weight` once for every ordered pair of vertices.
  WeightedGraph(std::vector<T> vertices, const WeightFunc& weight) : vertices_(std::move(vertices)) {
    edges_.reserve(vertices_.size());
    for (const auto& from : vertices_) {
      std::vector<std::optional<double>> row;
      row.reserve(vertices_.size());
      for (const auto& to : vertices_) {
        row.push_back(weight ? weight(from, to) : std::nullopt);
      }
      edges_.push_back(std::move(row));
    }
  }

  /// Returns the position of `vertex`, or -1 when it is not in the graph.
  long index_of(const T& vertex) const {
    for (size_t i = 0; i < vertices_.size(); ++i) {
      if (vertices_[i] == vertex) return static_cast<long>(i);
    }
    return -1;
  }

  /// Vertices reachable through one outgoing edge, in vertex order.
  std::vector<T> adjacent_of(const T& from) const {
    std::vector<T> adjacent;
    long index = index_of(from);
    if (index == -1) return adjacent;
    const auto& row = edges_[static_cast<size_t>(index)];
    for (size_t j = 0; j < row.size(); ++j) {
      if (row[j].has_value()) adjacent.push_back(vertices_[j]);
    }
    return adjacent;
  }

  std::optional<double> get_edge(const T& from, const T& to) const {
    long i = index_of(from);
    long j = index_of(to);
    if (i == -1 || j == -1) return std::nullopt;
    return edges_[static_cast<size_t>(i)][static_cast<size_t>(j)];
  }

  const std::vector<T>& vertices() const { return vertices_; }
  const std::vector<std::vector<std::optional<double>>>& edges() const { return edges_; }

  /// Builds a search tree rooted at `root` with the caller's children producer.
  /// The producer decides how edges become tree children; a cyclic graph needs a
  /// producer that does not revisit ancestors.
  Tree<T> make_tree(const T& root, const typename Tree<T>::ChildrenFunc& next) const {
    return Tree<T>::build(root, next);
  }

 private:
  std::vector<T> vertices_;
  std::vector<std::vector<std::optional<double>>> edges_;
};

}  // namespace sitenav
