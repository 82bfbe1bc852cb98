#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docpipe {

// "s-e" ranges (one-based, inclusive) that cover pages 1..page_count in
// batches of batch_size pages.
auto make_batch_ranges(int page_count, int batch_size)
    -> std::vector<std::string>;

// Expands a page selection such as "1-3,5" into sorted, unique page numbers.
// Throws ValidationException on malformed input, on zero or reversed bounds
// and, when page_count is given, on pages beyond it.
auto parse_page_ranges(
    std::string_view selection, std::optional<int> page_count = std::nullopt)
    -> std::vector<int>;

}  // namespace docpipe
