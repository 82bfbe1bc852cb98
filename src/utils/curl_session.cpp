#include "curl_session.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

namespace docpipe {

void
ensure_curl_initialized()
{
  static std::once_flag flag;
  static CURLcode status = CURLE_OK;
  std::call_once(flag, [] { status = curl_global_init(CURL_GLOBAL_ALL); });
  if (status != CURLE_OK) {
    throw std::runtime_error(
        std::string("curl_global_init failed: ") + curl_easy_strerror(status));
  }
}

auto
make_curl_easy() -> CurlEasyPtr
{
  ensure_curl_initialized();
  CurlEasyPtr handle(curl_easy_init());
  if (!handle) {
    throw std::runtime_error("curl_easy_init failed");
  }
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(handle.get(), CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, "docpipe/1.0");
  return handle;
}

auto
curl_error_text(CURLcode code, const char* error_buffer) -> std::string
{
  if (error_buffer != nullptr && error_buffer[0] != '\0') {
    return error_buffer;
  }
  return curl_easy_strerror(code);
}

}  // namespace docpipe
