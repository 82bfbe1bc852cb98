#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "storage/atomic_file.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace docpipe;

namespace {
auto
count_entries(const std::filesystem::path& dir) -> int
{
  int count = 0;
  for ([[maybe_unused]] const auto& entry :
       std::filesystem::directory_iterator(dir)) {
    ++count;
  }
  return count;
}
}  // namespace

TEST(AtomicFile, ReplacesContentsWithoutLeftovers)
{
  TempDir dir;
  const auto target = dir.path() / "status.json";
  write_file_atomic(target, "first");
  write_file_atomic(target, "second");
  EXPECT_EQ(read_text_file(target), "second");
  EXPECT_EQ(count_entries(dir.path()), 1);
}

TEST(AtomicFile, JsonRoundTrip)
{
  TempDir dir;
  const auto target = dir.path() / "doc.json";
  Json::Value value;
  value["task_id"] = "abc";
  value["pages"] = 3;
  value["title"] = "r\xC3\xA9sum\xC3\xA9";
  write_json_atomic(target, value);

  const auto loaded = read_json_file(target);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ((*loaded)["task_id"].asString(), "abc");
  EXPECT_EQ((*loaded)["pages"].asInt(), 3);
  EXPECT_EQ((*loaded)["title"].asString(), "r\xC3\xA9sum\xC3\xA9");
  EXPECT_NE(read_text_file(target).find("r\xC3\xA9sum\xC3\xA9"),
            std::string::npos);
}

TEST(AtomicFile, MissingJsonIsNullopt)
{
  TempDir dir;
  EXPECT_FALSE(read_json_file(dir.path() / "absent.json").has_value());
}
