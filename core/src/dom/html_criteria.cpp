#include "sitenav/html_criteria.h"

#include <cctype>

#include "sitenav/errors.h"
#include "../util/string_util.h"

namespace sitenav {

namespace {

bool has_class_token(const HtmlNode& node, const std::string& token) {
  auto value = get_attribute(node, "class");
  if (!value.has_value()) return false;
  for (const auto& item : util::split_ws(*value)) {
    if (item == token) return true;
  }
  return false;
}

bool is_key_char(char c) {
  unsigned char uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || c == '-' || c == '_' || c == ':' || c == '.';
}

void skip_ws(const std::string& s, size_t& i) {
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
    ++i;
  }
}

const std::string kAttrPrefix = "attr.";

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

std::string parse_value(const std::string& text, size_t& i) {
  if (i < text.size() && (text[i] == '\'' || text[i] == '"')) {
    const size_t quote_pos = i;
    const char quote = text[i++];
    size_t end = text.find(quote, i);
    if (end == std::string::npos) {
      throw CriteriaParseError("Unterminated quoted value", quote_pos);
    }
    std::string value = text.substr(i, end - i);
    i = end + 1;
    return value;
  }
  size_t start = i;
  while (i < text.size() && text[i] != ';') {
    ++i;
  }
  return util::trim_ws(text.substr(start, i - start));
}

void apply_term(HtmlCriteriaBuilder& builder,
                const std::string& key,
                size_t key_pos,
                const std::string& value,
                size_t value_pos) {
  const std::string lower_key = util::to_lower(key);
  if (lower_key == "type") {
    auto type = parse_node_type(value);
    if (!type.has_value()) {
      throw CriteriaParseError("Unknown node type '" + value + "'", value_pos);
    }
    builder.set_type(*type);
    return;
  }
  if (lower_key == "tag") {
    if (value.empty()) {
      throw CriteriaParseError("Empty tag name", value_pos);
    }
    if (util::split_ws(value).size() != 1) {
      throw CriteriaParseError("Invalid tag name '" + value + "'", value_pos);
    }
    builder.set_type(HtmlNodeType::Element);
    builder.set_data(value);
    return;
  }
  if (lower_key == "data") {
    builder.set_data(value);
    return;
  }
  if (lower_key == "id") {
    builder.set_id(value);
    return;
  }
  if (lower_key == "class") {
    auto tokens = util::split_ws(value);
    if (tokens.empty()) {
      throw CriteriaParseError("Empty class name", value_pos);
    }
    for (const auto& token : tokens) {
      builder.add_class(token);
    }
    return;
  }
  if (lower_key == "text") {
    builder.set_text_contains(value);
    return;
  }
  if (starts_with(lower_key, kAttrPrefix)) {
    std::string name = lower_key.substr(kAttrPrefix.size());
    if (name.empty()) {
      throw CriteriaParseError("Missing attribute name", key_pos);
    }
    builder.add_attr(name, value);
    return;
  }
  throw CriteriaParseError("Unknown criteria key '" + key + "'", key_pos);
}

}  // namespace

HtmlCriteriaBuilder& HtmlCriteriaBuilder::set_type(HtmlNodeType type) {
  type_ = type;
  return *this;
}

HtmlCriteriaBuilder& HtmlCriteriaBuilder::set_data(const std::string& data) {
  data_ = data;
  return *this;
}

HtmlCriteriaBuilder& HtmlCriteriaBuilder::add_attr(const std::string& key, const std::string& value) {
  attrs_.push_back(AttrConstraint{util::to_lower(key), value});
  return *this;
}

HtmlCriteriaBuilder& HtmlCriteriaBuilder::require_attr(const std::string& key) {
  attrs_.push_back(AttrConstraint{util::to_lower(key), std::nullopt});
  return *this;
}

HtmlCriteriaBuilder& HtmlCriteriaBuilder::add_class(const std::string& token) {
  classes_.push_back(token);
  return *this;
}

HtmlCriteriaBuilder& HtmlCriteriaBuilder::set_id(const std::string& id) {
  return add_attr("id", id);
}

HtmlCriteriaBuilder& HtmlCriteriaBuilder::set_text_contains(const std::string& needle) {
  text_contains_ = needle;
  return *this;
}

HtmlCriteria HtmlCriteriaBuilder::build() const {
  return HtmlCriteria([self = *this](const HtmlNode* const& node) {
    if (node == nullptr) return false;
    if (self.type_.has_value() && node->type != *self.type_) return false;
    if (self.data_.has_value()) {
      if (node->type == HtmlNodeType::Element) {
        if (util::to_lower(node->data) != util::to_lower(*self.data_)) return false;
      } else if (node->data != *self.data_) {
        return false;
      }
    }
    for (const auto& constraint : self.attrs_) {
      auto value = get_attribute(*node, constraint.key);
      if (!value.has_value()) return false;
      if (constraint.value.has_value() && *value != *constraint.value) return false;
    }
    for (const auto& token : self.classes_) {
      if (!has_class_token(*node, token)) return false;
    }
    if (self.text_contains_.has_value() &&
        !util::contains_ci(inner_text(*node), *self.text_contains_)) {
      return false;
    }
    return true;
  });
}

HtmlCriteria is_text_node_search() {
  return HtmlCriteriaBuilder(HtmlNodeType::Text).build();
}

HtmlCriteria parse_criteria(const std::string& text) {
  if (util::trim_ws(text).empty()) {
    throw CriteriaParseError("Empty criteria", 0);
  }
  if (util::trim_ws(text) == "*") {
    return HtmlCriteria::wildcard();
  }

  HtmlCriteriaBuilder builder;
  size_t i = 0;
  while (i < text.size()) {
    skip_ws(text, i);
    const size_t key_pos = i;
    std::string key;
    while (i < text.size() && is_key_char(text[i])) {
      key.push_back(text[i++]);
    }
    if (key.empty()) {
      throw CriteriaParseError("Expected criteria key", key_pos);
    }
    skip_ws(text, i);
    if (i < text.size() && text[i] == '=') {
      ++i;
      skip_ws(text, i);
      const size_t value_pos = i;
      std::string value = parse_value(text, i);
      apply_term(builder, key, key_pos, value, value_pos);
    } else if (starts_with(util::to_lower(key), kAttrPrefix)) {
      std::string name = util::to_lower(key).substr(kAttrPrefix.size());
      if (name.empty()) {
        throw CriteriaParseError("Missing attribute name", key_pos);
      }
      builder.require_attr(name);
    } else {
      builder.set_type(HtmlNodeType::Element);
      builder.set_data(key);
    }
    skip_ws(text, i);
    if (i >= text.size()) break;
    if (text[i] != ';') {
      throw CriteriaParseError("Expected ';' between terms", i);
    }
    ++i;
    skip_ws(text, i);
  }
  return builder.build();
}

}  // namespace sitenav
