#include "pdf_inspector.hpp"

#include <fpdfview.h>

#include <array>
#include <fstream>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

namespace docpipe {

namespace {

constexpr std::string_view kPdfMagic = "%PDF-";

// PDFium keeps global state and is not thread-safe; every call into it goes
// through this lock after the one-time library init.
auto
pdfium_mutex() -> std::mutex&
{
  static std::mutex mutex;
  return mutex;
}

void
ensure_pdfium_initialized()
{
  static std::once_flag once;
  std::call_once(once, [] { FPDF_InitLibrary(); });
}

struct DocumentCloser {
  void operator()(FPDF_DOCUMENT doc) const noexcept
  {
    if (doc != nullptr) {
      FPDF_CloseDocument(doc);
    }
  }
};

using DocumentHandle =
    std::unique_ptr<std::remove_pointer_t<FPDF_DOCUMENT>, DocumentCloser>;

auto
page_count_of(const DocumentHandle& doc) -> std::optional<int>
{
  if (!doc) {
    return std::nullopt;
  }
  const int pages = FPDF_GetPageCount(doc.get());
  if (pages < 0) {
    return std::nullopt;
  }
  return pages;
}

}  // namespace

auto
is_pdf_file(const std::filesystem::path& path) -> bool
{
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    return false;
  }
  std::array<char, kPdfMagic.size()> head{};
  input.read(head.data(), static_cast<std::streamsize>(head.size()));
  return input.gcount() == static_cast<std::streamsize>(head.size()) &&
         std::string_view(head.data(), head.size()) == kPdfMagic;
}

auto
pdf_page_count_from_bytes(std::string_view bytes) -> std::optional<int>
{
  if (bytes.empty() ||
      bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  ensure_pdfium_initialized();
  const std::scoped_lock lock(pdfium_mutex());
  const DocumentHandle doc(FPDF_LoadMemDocument(
      bytes.data(), static_cast<int>(bytes.size()), nullptr));
  return page_count_of(doc);
}

auto
pdf_page_count(const std::filesystem::path& path) -> std::optional<int>
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  ensure_pdfium_initialized();
  const std::string native = path.string();
  const std::scoped_lock lock(pdfium_mutex());
  const DocumentHandle doc(FPDF_LoadDocument(native.c_str(), nullptr));
  return page_count_of(doc);
}

}  // namespace docpipe
