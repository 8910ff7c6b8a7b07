#include "io_internal.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#ifdef SITENAV_USE_CURL
#include <curl/curl.h>
#endif

#include "../util/string_util.h"

namespace sitenav::io_internal {

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

#ifdef SITENAV_USE_CURL
namespace {

/// Appends curl response bytes into a caller-provided buffer.
/// MUST return the full byte count or curl treats it as an error.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

std::string normalize_content_type(const char* raw) {
  if (!raw) return "";
  std::string value(raw);
  size_t end = value.find(';');
  if (end != std::string::npos) {
    value = value.substr(0, end);
  }
  return util::to_lower(util::trim_ws(value));
}

// Returns an error message, empty when the content type is acceptable.
std::string check_content_type(CURL* curl) {
  const char* raw = nullptr;
  CURLcode info = curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &raw);
  if (info != CURLE_OK) {
    return "Failed to read Content-Type for URL";
  }
  std::string content_type = normalize_content_type(raw);
  if (content_type.empty()) {
    return "Missing Content-Type for URL";
  }
  if (content_type == "text/html" ||
      content_type == "application/xhtml+xml" ||
      content_type == "application/xml" ||
      content_type == "text/xml") {
    return "";
  }
  return "Unsupported Content-Type for HTML fetch: " + content_type;
}

}  // namespace
#endif

std::string fetch_url(const std::string& url, int timeout_ms) {
#ifdef SITENAV_USE_CURL
  CURL* curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to initialize curl");
  }
  std::string buffer;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "sitenav/0.1");
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    curl_easy_cleanup(curl);
    throw std::runtime_error(std::string("Failed to fetch URL: ") + curl_easy_strerror(res));
  }
  std::string content_error = check_content_type(curl);
  curl_easy_cleanup(curl);
  if (!content_error.empty()) {
    throw std::runtime_error(content_error);
  }
  return buffer;
#else
  (void)url;
  (void)timeout_ms;
  throw std::runtime_error("URL fetching is disabled (libcurl not available)");
#endif
}

}  // namespace sitenav::io_internal
