#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace docpipe {

struct FetchLimits {
  std::uintmax_t max_bytes = 0;
  long timeout_seconds = 60;
  std::size_t chunk_bytes = 4U * 1024U * 1024U;
};

// Streams `url` into `destination`. Throws FileTooLargeException when the body
// exceeds `limits.max_bytes` and DownloadException on transport or HTTP
// errors; in both cases the partial file is removed. Returns the byte count.
auto fetch_to_file(
    const std::string& url, const std::filesystem::path& destination,
    const FetchLimits& limits) -> std::uintmax_t;

// True for absolute http:// or https:// URLs.
[[nodiscard]] auto is_remote_url(const std::string& reference) -> bool;

}  // namespace docpipe
