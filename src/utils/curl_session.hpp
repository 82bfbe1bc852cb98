#pragma once

#include <curl/curl.h>

#include <memory>
#include <string>

namespace docpipe {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Runs curl_global_init once per process; throws std::runtime_error when the
// library cannot be initialised.
void ensure_curl_initialized();

// New easy handle restricted to http/https with signals disabled. Throws
// std::runtime_error on allocation failure.
auto make_curl_easy() -> CurlEasyPtr;

auto curl_error_text(CURLcode code, const char* error_buffer) -> std::string;

}  // namespace docpipe
