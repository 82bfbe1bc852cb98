#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace docpipe {

// True when the file starts with the "%PDF-" magic.
[[nodiscard]] auto is_pdf_file(const std::filesystem::path& path) -> bool;

// Page count of a PDF as resolved by PDFium, which follows the cross-reference
// chain of incremental updates and reads object streams. Returns std::nullopt
// when the document cannot be opened (not a PDF, damaged beyond repair,
// encrypted). Never throws.
[[nodiscard]] auto pdf_page_count(const std::filesystem::path& path)
    -> std::optional<int>;

[[nodiscard]] auto pdf_page_count_from_bytes(std::string_view bytes)
    -> std::optional<int>;

}  // namespace docpipe
