#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/page_ranges.hpp"
#include "utils/exceptions.hpp"

using namespace docpipe;

TEST(PageRanges, BatchRangesCoverEveryPage)
{
  EXPECT_EQ(
      make_batch_ranges(120, 50),
      (std::vector<std::string>{"1-50", "51-100", "101-120"}));
  EXPECT_EQ(make_batch_ranges(50, 50), (std::vector<std::string>{"1-50"}));
  EXPECT_EQ(
      make_batch_ranges(3, 1), (std::vector<std::string>{"1-1", "2-2", "3-3"}));
  EXPECT_TRUE(make_batch_ranges(0, 50).empty());
}

TEST(PageRanges, ParsesSelections)
{
  EXPECT_EQ(parse_page_ranges("1-3,5"), (std::vector<int>{1, 2, 3, 5}));
  EXPECT_EQ(parse_page_ranges(" 4 , 2-3 "), (std::vector<int>{2, 3, 4}));
  EXPECT_EQ(parse_page_ranges("2-2,1-2"), (std::vector<int>{1, 2}));
  EXPECT_EQ(parse_page_ranges("7", 7), (std::vector<int>{7}));
}

TEST(PageRanges, RejectsMalformedSelections)
{
  for (const char* bad : {"", ",", "0", "0-2", "3-1", "a-b", "1-", "-2", "1;2",
                          "1,,2", "1.5"}) {
    EXPECT_THROW((void)parse_page_ranges(bad), ValidationException) << bad;
  }
}

TEST(PageRanges, RejectsPagesBeyondDocument)
{
  EXPECT_THROW((void)parse_page_ranges("1-11", 10), ValidationException);
  EXPECT_NO_THROW((void)parse_page_ranges("1-11"));
}
