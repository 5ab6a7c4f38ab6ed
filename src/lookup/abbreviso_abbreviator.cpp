#include "bibsane/lookup/abbreviso_abbreviator.h"

#include "bibsane/core/normalization.h"

#include <curl/curl.h>

#include <memory>
#include <utility>

namespace bibsane::lookup {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

size_t write_to_string(void* data, size_t size, size_t nmemb, void* user_data) {
  const size_t total = size * nmemb;
  static_cast<std::string*>(user_data)->append(static_cast<const char*>(data), total);
  return total;
}

std::string escape(CURL* handle, const std::string& text) {
  char* escaped = curl_easy_escape(handle, text.c_str(), static_cast<int>(text.size()));
  if (escaped == nullptr) {
    return {};
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

}  // namespace

AbbrevisoAbbreviator::AbbrevisoAbbreviator(long timeout_ms, std::string base_url)
    : timeout_ms_(timeout_ms), base_url_(std::move(base_url)) {}

AbbreviationResult AbbrevisoAbbreviator::abbreviate(const std::string& journal) {
  CurlEasyPtr handle(curl_easy_init());
  if (!handle) {
    return AbbreviationResult::err(LookupError{"curl_easy_init() failed"});
  }

  const std::string escaped = escape(handle.get(), journal);
  if (escaped.empty()) {
    return AbbreviationResult::err(LookupError{"cannot escape journal name: " + journal});
  }
  const std::string url = base_url_ + escaped;

  std::string body;
  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, static_cast<void*>(&body));

  const CURLcode code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    return AbbreviationResult::err(
        LookupError{"abbreviation lookup failed for '" + journal + "': " +
                    curl_easy_strerror(code)});
  }

  std::string abbreviation = core::trim(body);
  if (abbreviation.empty()) {
    return AbbreviationResult::err(
        LookupError{"abbreviation service returned nothing for '" + journal + "'"});
  }
  return AbbreviationResult::ok(std::move(abbreviation));
}

}  // namespace bibsane::lookup
