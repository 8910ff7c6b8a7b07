#include "sitenav/sitenav.h"

#include "io/io_internal.h"

namespace sitenav {

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

}  // namespace

std::shared_ptr<const HtmlDocument> load_document_from_file(const std::string& path) {
  return parse_html(io_internal::read_file(path), path);
}

std::shared_ptr<const HtmlDocument> load_document_from_url(const std::string& url, int timeout_ms) {
  return parse_html(io_internal::fetch_url(url, timeout_ms), url);
}

bool is_url(const std::string& input) {
  return starts_with(input, "http://") || starts_with(input, "https://");
}

}  // namespace sitenav
