#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sitenav {

enum class HtmlNodeType {
  Document,
  Element,
  Text,
  Comment,
  Doctype,
};

struct HtmlAttribute {
  std::string key;
  std::string value;
};

/// One node of a parsed HTML document with sibling/parent navigation.
/// Element data is the lowercase tag name; text and comment data is the raw content.
/// Links are owned by the HtmlDocument and MUST NOT outlive it.
struct HtmlNode {
  int64_t doc_order = 0;
  HtmlNodeType type = HtmlNodeType::Element;
  std::string data;
  std::vector<HtmlAttribute> attributes;
  HtmlNode* parent = nullptr;
  HtmlNode* first_child = nullptr;
  HtmlNode* last_child = nullptr;
  HtmlNode* prev_sibling = nullptr;
  HtmlNode* next_sibling = nullptr;
};

/// Owns every node of one document; node addresses are stable until destruction.
/// The root is always a Document node with doc_order 0.
class HtmlDocument {
 public:
  explicit HtmlDocument(std::string source_uri = "document");

  HtmlDocument(const HtmlDocument&) = delete;
  HtmlDocument& operator=(const HtmlDocument&) = delete;

  const HtmlNode* root() const { return nodes_.front().get(); }
  HtmlNode* root() { return nodes_.front().get(); }
  size_t size() const { return nodes_.size(); }
  const std::string& source_uri() const { return source_uri_; }

  /// Appends a new last child under `parent` and returns it.
  /// MUST receive a node owned by this document.
  HtmlNode* append_child(HtmlNode* parent, HtmlNodeType type, std::string data);

 private:
  std::vector<std::unique_ptr<HtmlNode>> nodes_;
  std::string source_uri_;
};

/// Parses HTML with libxml2 in recovering mode.
/// MUST NOT throw on malformed markup; an unparseable input yields a bare document node.
std::shared_ptr<const HtmlDocument> parse_html(const std::string& html,
                                               const std::string& source_uri = "document");

/// Returns the node's children in document order; empty for a null node.
std::vector<const HtmlNode*> get_direct_children(const HtmlNode* node);

/// Returns the value of attribute `key` (lowercase) or nullopt when missing.
std::optional<std::string> get_attribute(const HtmlNode& node, const std::string& key);

/// Concatenates the text of every descendant text node in document order.
std::string inner_text(const HtmlNode& node);

std::string node_type_name(HtmlNodeType type);
std::optional<HtmlNodeType> parse_node_type(const std::string& name);

}  // namespace sitenav
