#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sitenav/html_document.h"
#include "sitenav/html_tree.h"

namespace sitenav {

/// Assembles an HTML search criteria from independent constraints.
/// Every constraint set on the builder MUST hold for a node to match; a builder
/// with no constraints matches every node.
class HtmlCriteriaBuilder {
 public:
  HtmlCriteriaBuilder() = default;
  explicit HtmlCriteriaBuilder(HtmlNodeType type) : type_(type) {}

  HtmlCriteriaBuilder& set_type(HtmlNodeType type);
  /// Tag name for elements (case-insensitive), exact content otherwise.
  HtmlCriteriaBuilder& set_data(const std::string& data);
  /// Requires attribute `key` to exist and equal `value`.
  HtmlCriteriaBuilder& add_attr(const std::string& key, const std::string& value);
  /// Requires attribute `key` to exist with any value.
  HtmlCriteriaBuilder& require_attr(const std::string& key);
  /// Requires `token` among the whitespace-separated class names.
  HtmlCriteriaBuilder& add_class(const std::string& token);
  HtmlCriteriaBuilder& set_id(const std::string& id);
  /// Case-insensitive substring of the node's inner text.
  HtmlCriteriaBuilder& set_text_contains(const std::string& needle);

  HtmlCriteria build() const;

 private:
  struct AttrConstraint {
    std::string key;
    std::optional<std::string> value;
  };

  std::optional<HtmlNodeType> type_;
  std::optional<std::string> data_;
  std::vector<AttrConstraint> attrs_;
  std::vector<std::string> classes_;
  std::optional<std::string> text_contains_;
};

/// Matches text nodes.
HtmlCriteria is_text_node_search();

/// Parses one stage of the textual criteria language into a criteria.
/// Terms are `;`-separated `key=value` pairs (type, tag, data, id, class, text,
/// attr.<name>), `attr.<name>` alone for presence, a bare word as tag shorthand,
/// or `*` for a wildcard. Values may be single or double quoted.
/// MUST throw CriteriaParseError on malformed input.
HtmlCriteria parse_criteria(const std::string& text);

}  // namespace sitenav
