#include "time_utils.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace docpipe::time_utils {

auto
to_epoch_seconds(const std::chrono::system_clock::time_point& time_point)
    -> double
{
  return std::chrono::duration<double>(time_point.time_since_epoch()).count();
}

auto
from_epoch_seconds(double seconds) -> std::chrono::system_clock::time_point
{
  return std::chrono::system_clock::time_point{
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::duration<double>(seconds))};
}

auto
now_epoch_seconds() -> double
{
  return to_epoch_seconds(std::chrono::system_clock::now());
}

auto
format_timestamp(const std::chrono::system_clock::time_point& time_point)
    -> std::string
{
  constexpr int MillisecondsPerSecond = 1000;
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
                          time_point.time_since_epoch()) %
                      MillisecondsPerSecond;

  std::time_t time = std::chrono::system_clock::to_time_t(time_point);
  std::tm local_tm{};
  localtime_r(&time, &local_tm);
  std::ostringstream oss;
  oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << milliseconds.count();
  return oss.str();
}

auto
format_optional_timestamp(
    const std::optional<std::chrono::system_clock::time_point>& time_point)
    -> std::string
{
  return time_point ? format_timestamp(*time_point) : std::string{"-"};
}

}  // namespace docpipe::time_utils
