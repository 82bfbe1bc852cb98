#include <gtest/gtest.h>

#include <filesystem>
#include <new>
#include <stdexcept>
#include <system_error>

#include "utils/exceptions.hpp"

using namespace docpipe;

TEST(Exceptions, KindNamesRoundTrip)
{
  using enum ErrorKind;
  for (const auto kind :
       {Internal, QueueFull, RateLimited, Validation, Timeout, EngineLoad,
        Engine, Download, Publish, Storage, State}) {
    const auto parsed = parse_error_kind(error_kind_name(kind));
    ASSERT_TRUE(parsed.has_value()) << error_kind_name(kind);
    EXPECT_EQ(*parsed, kind);
  }
  EXPECT_FALSE(parse_error_kind("segfault").has_value());
}

TEST(Exceptions, ValidationSubclassesShareKind)
{
  EXPECT_EQ(FileTooLargeException("big").kind(), ErrorKind::Validation);
  EXPECT_EQ(PageLimitExceededException("pages").kind(), ErrorKind::Validation);
  EXPECT_EQ(InvalidTaskIdException("id").kind(), ErrorKind::Validation);
  EXPECT_EQ(PathValidationException("path").kind(), ErrorKind::Validation);
}

TEST(Exceptions, DescribeKnownError)
{
  const auto info = describe_error(AcquisitionTimeoutException("slot wait"));
  EXPECT_EQ(info.kind, ErrorKind::Timeout);
  EXPECT_EQ(info.message, "slot wait");
  EXPECT_EQ(error_kind_name(info.kind), "timeout");
}

TEST(Exceptions, DescribeFilesystemErrorAsStorage)
{
  const std::filesystem::filesystem_error error(
      "rename", std::make_error_code(std::errc::permission_denied));
  EXPECT_EQ(describe_error(error).kind, ErrorKind::Storage);
}

TEST(Exceptions, DescribeForeignErrorsAsInternal)
{
  EXPECT_EQ(describe_error(std::bad_alloc()).message, "out of memory");
  const auto info = describe_error(std::runtime_error("boom"));
  EXPECT_EQ(info.kind, ErrorKind::Internal);
  EXPECT_EQ(info.message, "boom");
}
