#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace docpipe::time_utils {

// Wall-clock seconds since the epoch, as stored in status and token files.
auto to_epoch_seconds(const std::chrono::system_clock::time_point& time_point)
    -> double;
auto from_epoch_seconds(double seconds) -> std::chrono::system_clock::time_point;
auto now_epoch_seconds() -> double;

auto format_timestamp(const std::chrono::system_clock::time_point& time_point)
    -> std::string;
auto format_optional_timestamp(
    const std::optional<std::chrono::system_clock::time_point>& time_point)
    -> std::string;

}  // namespace docpipe::time_utils
