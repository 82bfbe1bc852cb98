#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <regex>

#include "utils/time_utils.hpp"

using namespace docpipe;

TEST(TimeUtils, EpochSecondsRoundTripKeepsMilliseconds)
{
  const auto point = std::chrono::system_clock::time_point{
      std::chrono::milliseconds(1'700'000'000'123)};
  const double seconds = time_utils::to_epoch_seconds(point);
  EXPECT_NEAR(seconds, 1'700'000'000.123, 1e-6);

  const auto back = time_utils::from_epoch_seconds(seconds);
  const auto drift = std::chrono::duration_cast<std::chrono::microseconds>(
      back - point);
  EXPECT_LE(std::abs(drift.count()), 1);
}

TEST(TimeUtils, NowIsCloseToSystemClock)
{
  const double before =
      time_utils::to_epoch_seconds(std::chrono::system_clock::now());
  const double now = time_utils::now_epoch_seconds();
  EXPECT_GE(now, before);
  EXPECT_LT(now - before, 5.0);
}

TEST(TimeUtils, FormatTimestampHasMillisecondPrecision)
{
  const auto formatted =
      time_utils::format_timestamp(std::chrono::system_clock::now());
  const std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3})");
  EXPECT_TRUE(std::regex_match(formatted, pattern)) << formatted;
}

TEST(TimeUtils, FormatOptionalTimestampDash)
{
  EXPECT_EQ(time_utils::format_optional_timestamp(std::nullopt), "-");
}
