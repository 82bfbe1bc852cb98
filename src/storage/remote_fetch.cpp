#include "remote_fetch.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <system_error>

#include "utils/curl_session.hpp"
#include "utils/exceptions.hpp"

namespace docpipe {

namespace {

struct FetchState {
  std::ofstream* out = nullptr;
  std::uintmax_t written = 0;
  std::uintmax_t max_bytes = 0;
  bool too_large = false;
  bool write_failed = false;
};

auto
write_chunk(char* data, std::size_t size, std::size_t nmemb, void* userp)
    -> std::size_t
{
  auto* state = static_cast<FetchState*>(userp);
  const std::size_t bytes = size * nmemb;
  if (state->max_bytes > 0 && state->written + bytes > state->max_bytes) {
    state->too_large = true;
    return 0;
  }
  state->out->write(data, static_cast<std::streamsize>(bytes));
  if (!*state->out) {
    state->write_failed = true;
    return 0;
  }
  state->written += bytes;
  return bytes;
}

void
discard(const std::filesystem::path& path)
{
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

auto
is_remote_url(const std::string& reference) -> bool
{
  return reference.starts_with("http://") || reference.starts_with("https://");
}

auto
fetch_to_file(
    const std::string& url, const std::filesystem::path& destination,
    const FetchLimits& limits) -> std::uintmax_t
{
  if (!is_remote_url(url)) {
    throw DownloadException(std::format("Unsupported URL scheme: {}", url));
  }

  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw StorageException(
        std::format("Cannot open {} for writing", destination.string()));
  }

  FetchState state;
  state.out = &out;
  state.max_bytes = limits.max_bytes;

  std::array<char, CURL_ERROR_SIZE> error_buffer{};
  CurlEasyPtr curl;
  try {
    curl = make_curl_easy();
  }
  catch (const std::runtime_error& e) {
    out.close();
    discard(destination);
    throw DownloadException(e.what());
  }
  CURL* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT, limits.timeout_seconds);
  curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, static_cast<long>(std::min<std::size_t>(
                                                   limits.chunk_bytes, CURL_MAX_READ_SIZE)));
  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer.data());
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_chunk);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
  if (limits.max_bytes > 0) {
    curl_easy_setopt(
        handle, CURLOPT_MAXFILESIZE_LARGE,
        static_cast<curl_off_t>(limits.max_bytes));
  }

  const CURLcode code = curl_easy_perform(handle);
  out.close();

  if (state.too_large || code == CURLE_FILESIZE_EXCEEDED) {
    discard(destination);
    throw FileTooLargeException(std::format(
        "Remote file exceeds the {} byte limit", limits.max_bytes));
  }
  if (state.write_failed) {
    discard(destination);
    throw StorageException(
        std::format("Failed writing {}", destination.string()));
  }
  if (code != CURLE_OK) {
    discard(destination);
    throw DownloadException(std::format(
        "Failed to download {}: {}", url,
        curl_error_text(code, error_buffer.data())));
  }
  return state.written;
}

}  // namespace docpipe
