#pragma once

#include <memory>
#include <string>

#include "sitenav/errors.h"
#include "sitenav/html_criteria.h"
#include "sitenav/html_document.h"
#include "sitenav/html_tree.h"
#include "sitenav/search.h"
#include "sitenav/tree.h"
#include "sitenav/version.h"
#include "sitenav/weighted_graph.h"

namespace sitenav {

/// Reads and parses an HTML file; the document's source_uri is the path.
/// MUST report IO failures via exceptions.
std::shared_ptr<const HtmlDocument> load_document_from_file(const std::string& path);
/// Downloads and parses an HTML page through libcurl.
/// MUST honor timeout_ms and MUST fail when network support is unavailable.
std::shared_ptr<const HtmlDocument> load_document_from_url(const std::string& url, int timeout_ms);
/// Returns true for http:// and https:// inputs.
bool is_url(const std::string& input);

}  // namespace sitenav
