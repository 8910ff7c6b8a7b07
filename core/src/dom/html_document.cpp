#include "sitenav/html_document.h"

#include <utility>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include "../util/string_util.h"

namespace sitenav {

namespace {

const char* as_chars(const xmlChar* value) {
  return reinterpret_cast<const char*>(value);
}

void copy_attributes(HtmlNode& out, xmlNode* node) {
  for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
    HtmlAttribute attribute;
    attribute.key = util::to_lower(as_chars(attr->name));
    xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
    if (value) {
      attribute.value = as_chars(value);
      xmlFree(value);
    }
    out.attributes.push_back(std::move(attribute));
  }
}

void walk_node(HtmlDocument& doc, HtmlNode* parent, xmlNode* node) {
  for (xmlNode* cur = node; cur != nullptr; cur = cur->next) {
    switch (cur->type) {
      case XML_ELEMENT_NODE: {
        HtmlNode* element =
            doc.append_child(parent, HtmlNodeType::Element, util::to_lower(as_chars(cur->name)));
        copy_attributes(*element, cur);
        if (cur->children) {
          walk_node(doc, element, cur->children);
        }
        break;
      }
      case XML_TEXT_NODE:
      case XML_CDATA_SECTION_NODE:
        if (cur->content) {
          doc.append_child(parent, HtmlNodeType::Text, as_chars(cur->content));
        }
        break;
      case XML_COMMENT_NODE:
        doc.append_child(parent, HtmlNodeType::Comment, cur->content ? as_chars(cur->content) : "");
        break;
      case XML_DTD_NODE:
        doc.append_child(parent, HtmlNodeType::Doctype, cur->name ? as_chars(cur->name) : "html");
        break;
      default:
        // Entity references and processing instructions are flattened into the parent.
        if (cur->children && cur->type != XML_ENTITY_REF_NODE) {
          walk_node(doc, parent, cur->children);
        }
        break;
    }
  }
}

void collect_text(const HtmlNode& node, std::string& out) {
  for (const HtmlNode* child = node.first_child; child != nullptr; child = child->next_sibling) {
    if (child->type == HtmlNodeType::Text) {
      out += child->data;
    } else if (child->type == HtmlNodeType::Element) {
      collect_text(*child, out);
    }
  }
}

}  // namespace

HtmlDocument::HtmlDocument(std::string source_uri) : source_uri_(std::move(source_uri)) {
  auto root = std::make_unique<HtmlNode>();
  root->type = HtmlNodeType::Document;
  nodes_.push_back(std::move(root));
}

HtmlNode* HtmlDocument::append_child(HtmlNode* parent, HtmlNodeType type, std::string data) {
  auto node = std::make_unique<HtmlNode>();
  node->doc_order = static_cast<int64_t>(nodes_.size());
  node->type = type;
  node->data = std::move(data);
  node->parent = parent;
  if (parent) {
    node->prev_sibling = parent->last_child;
    if (parent->last_child) {
      parent->last_child->next_sibling = node.get();
    } else {
      parent->first_child = node.get();
    }
    parent->last_child = node.get();
  }
  nodes_.push_back(std::move(node));
  return nodes_.back().get();
}

std::shared_ptr<const HtmlDocument> parse_html(const std::string& html,
                                               const std::string& source_uri) {
  auto doc = std::make_shared<HtmlDocument>(source_uri);
  if (html.empty()) {
    return doc;
  }
  htmlDocPtr html_doc = htmlReadMemory(
      html.data(),
      static_cast<int>(html.size()),
      nullptr,
      nullptr,
      HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET |
          HTML_PARSE_NODEFDTD);
  if (!html_doc) {
    return doc;
  }
  walk_node(*doc, doc->root(), html_doc->children);
  xmlFreeDoc(html_doc);
  return doc;
}

std::vector<const HtmlNode*> get_direct_children(const HtmlNode* node) {
  std::vector<const HtmlNode*> children;
  if (!node) return children;
  for (const HtmlNode* child = node->first_child; child != nullptr; child = child->next_sibling) {
    children.push_back(child);
  }
  return children;
}

std::optional<std::string> get_attribute(const HtmlNode& node, const std::string& key) {
  for (const auto& attribute : node.attributes) {
    if (attribute.key == key) return attribute.value;
  }
  return std::nullopt;
}

std::string inner_text(const HtmlNode& node) {
  if (node.type == HtmlNodeType::Text) return node.data;
  std::string out;
  collect_text(node, out);
  return out;
}

std::string node_type_name(HtmlNodeType type) {
  switch (type) {
    case HtmlNodeType::Document:
      return "document";
    case HtmlNodeType::Element:
      return "element";
    case HtmlNodeType::Text:
      return "text";
    case HtmlNodeType::Comment:
      return "comment";
    case HtmlNodeType::Doctype:
      return "doctype";
  }
  return "element";
}

std::optional<HtmlNodeType> parse_node_type(const std::string& name) {
  std::string lower = util::to_lower(name);
  if (lower == "document") return HtmlNodeType::Document;
  if (lower == "element") return HtmlNodeType::Element;
  if (lower == "text") return HtmlNodeType::Text;
  if (lower == "comment") return HtmlNodeType::Comment;
  if (lower == "doctype") return HtmlNodeType::Doctype;
  return std::nullopt;
}

}  // namespace sitenav
