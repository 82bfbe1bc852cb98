#include "page_ranges.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <set>

#include "utils/exceptions.hpp"

namespace docpipe {

namespace {

constexpr int kMaxPageNumber = 100000;

auto
trim(std::string_view text) -> std::string_view
{
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

auto
parse_page_number(std::string_view text, std::string_view selection) -> int
{
  text = trim(text);
  int value = 0;
  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
      value < 1 || value > kMaxPageNumber) {
    throw ValidationException(
        std::format("Invalid page range '{}'", selection));
  }
  return value;
}

}  // namespace

auto
make_batch_ranges(int page_count, int batch_size) -> std::vector<std::string>
{
  std::vector<std::string> ranges;
  if (page_count <= 0) {
    return ranges;
  }
  const int step = std::max(1, batch_size);
  for (int start = 1; start <= page_count; start += step) {
    const int end = std::min(start + step - 1, page_count);
    ranges.push_back(std::format("{}-{}", start, end));
  }
  return ranges;
}

auto
parse_page_ranges(std::string_view selection, std::optional<int> page_count)
    -> std::vector<int>
{
  std::set<int> pages;
  std::string_view rest = selection;
  while (true) {
    const auto comma = rest.find(',');
    const auto part = trim(rest.substr(0, comma));
    if (part.empty()) {
      throw ValidationException(
          std::format("Invalid page range '{}'", selection));
    }

    int first = 0;
    int last = 0;
    if (const auto dash = part.find('-'); dash != std::string_view::npos) {
      first = parse_page_number(part.substr(0, dash), selection);
      last = parse_page_number(part.substr(dash + 1), selection);
    } else {
      first = last = parse_page_number(part, selection);
    }
    if (last < first) {
      throw ValidationException(
          std::format("Reversed page range '{}'", selection));
    }
    if (page_count && last > *page_count) {
      throw ValidationException(std::format(
          "Page range '{}' exceeds the document's {} pages", selection,
          *page_count));
    }
    for (int page = first; page <= last; ++page) {
      pages.insert(page);
    }

    if (comma == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(comma + 1);
  }
  return {pages.begin(), pages.end()};
}

}  // namespace docpipe
