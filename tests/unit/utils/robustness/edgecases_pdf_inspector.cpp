#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "test_helpers.hpp"
#include "utils/pdf_inspector.hpp"

using namespace docpipe;

TEST(PdfInspectorEdgeCases, NonPdfBytesHaveNoCount)
{
  EXPECT_FALSE(pdf_page_count_from_bytes("").has_value());
  EXPECT_FALSE(pdf_page_count_from_bytes("\x89PNG\r\n").has_value());
  EXPECT_FALSE(
      pdf_page_count_from_bytes("hello /Type /Pages /Count 3").has_value());
}

TEST(PdfInspectorEdgeCases, MissingFile)
{
  EXPECT_FALSE(is_pdf_file("/nonexistent/file.pdf"));
  EXPECT_FALSE(pdf_page_count("/nonexistent/file.pdf").has_value());
}

TEST(PdfInspectorEdgeCases, DirectoryHasNoCount)
{
  TempDir dir;
  EXPECT_FALSE(pdf_page_count(dir.path()).has_value());
}

TEST(PdfInspectorEdgeCases, ShortFileIsNotPdf)
{
  TempDir dir;
  const auto path = dir.path() / "short.pdf";
  write_file(path, "%PD");
  EXPECT_FALSE(is_pdf_file(path));
  EXPECT_FALSE(pdf_page_count(path).has_value());
}

TEST(PdfInspectorEdgeCases, ConcurrentCallersGetConsistentCounts)
{
  const auto small = make_pdf_bytes(2);
  const auto large = make_object_stream_pdf_bytes(9);
  std::atomic<int> mismatches{0};
  std::vector<std::jthread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 20; ++i) {
        const auto expected = t % 2 == 0 ? 2 : 9;
        const auto count =
            pdf_page_count_from_bytes(t % 2 == 0 ? small : large);
        if (count != expected) {
          mismatches.fetch_add(1);
        }
      }
    });
  }
  threads.clear();
  EXPECT_EQ(mismatches.load(), 0);
}
