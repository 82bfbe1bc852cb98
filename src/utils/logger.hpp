#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace docpipe {
// Logging utilities
// -----------------
// Every line is written under a single process-wide mutex so that workers,
// the idle watcher and the sweepers never interleave partial lines. Lines
// carry the calling thread's tag ("worker-3", "idle-watcher", ...) when one
// was registered with set_thread_log_tag().

inline std::mutex log_mutex;

enum class VerbosityLevel : std::uint8_t {
  Silent = 0,
  Info = 1,
  Stats = 2,
  Debug = 3,
  Trace = 4
};

namespace detail {
inline auto
thread_log_tag() -> std::string&
{
  thread_local std::string tag;
  return tag;
}

inline auto
tag_prefix() -> std::string
{
  const auto& tag = thread_log_tag();
  if (tag.empty()) {
    return {};
  }
  return "[" + tag + "] ";
}
}  // namespace detail

inline void
set_thread_log_tag(std::string tag)
{
  detail::thread_log_tag() = std::move(tag);
}

inline void
clear_thread_log_tag()
{
  detail::thread_log_tag().clear();
}

// =============================================================================
// Parse a verbosity level from a name ("debug") or a number ("3")
// =============================================================================

inline auto
parse_verbosity_level(std::string_view val) -> VerbosityLevel
{
  using enum VerbosityLevel;

  const auto first = val.find_first_not_of(" \t\n\r\f\v");
  const auto last = val.find_last_not_of(" \t\n\r\f\v");
  const std::string trimmed =
      first == std::string_view::npos
          ? std::string{}
          : std::string{val.substr(first, last - first + 1)};
  if (trimmed.empty()) {
    throw std::invalid_argument("Empty verbosity level");
  }

  if (std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    if (trimmed.size() > 1) {
      throw std::invalid_argument("Invalid verbosity level: " + trimmed);
    }
    switch (trimmed.front() - '0') {
      case 0:
        return Silent;
      case 1:
        return Info;
      case 2:
        return Stats;
      case 3:
        return Debug;
      case 4:
        return Trace;
      default:
        throw std::invalid_argument("Invalid verbosity level: " + trimmed);
    }
  }

  std::string lower(trimmed.size(), '\0');
  std::transform(
      trimmed.begin(), trimmed.end(), lower.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "silent" || lower == "quiet") {
    return Silent;
  }
  if (lower == "info") {
    return Info;
  }
  if (lower == "stats") {
    return Stats;
  }
  if (lower == "debug") {
    return Debug;
  }
  if (lower == "trace") {
    return Trace;
  }
  throw std::invalid_argument("Invalid verbosity level: " + trimmed);
}

inline auto
verbosity_label(const VerbosityLevel level) -> const char*
{
  using enum VerbosityLevel;
  switch (level) {
    case Info:
      return "[INFO] ";
    case Stats:
      return "[STATS] ";
    case Debug:
      return "[DEBUG] ";
    case Trace:
      return "[TRACE] ";
    default:
      return "";
  }
}

inline auto
should_log(const VerbosityLevel level, const VerbosityLevel current_level)
    -> bool
{
  return level != VerbosityLevel::Silent &&
         std::to_underlying(current_level) >= std::to_underlying(level);
}

// =============================================================================
// Verbosity-controlled logging (stdout)
// =============================================================================

inline void
log_verbose(
    const VerbosityLevel level, const VerbosityLevel current_level,
    const std::string& message)
{
  if (!should_log(level, current_level)) {
    return;
  }
  const std::string line =
      std::string(verbosity_label(level)) + detail::tag_prefix() + message;
  const std::scoped_lock lock(log_mutex);
  std::cout << line << '\n' << std::flush;
}

inline void
log_info(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Info, lvl, msg);
}

inline void
log_stats(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Stats, lvl, msg);
}

inline void
log_debug(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Debug, lvl, msg);
}

inline void
log_trace(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Trace, lvl, msg);
}

// =============================================================================
// Unconditional stderr logging
// =============================================================================

inline void
log_warning(const std::string& message)
{
  const std::string line = "[WARNING] " + detail::tag_prefix() + message;
  const std::scoped_lock lock(log_mutex);
  std::cerr << line << '\n' << std::flush;
}

inline void
log_error(const std::string& message)
{
  const std::string line = "[ERROR] " + detail::tag_prefix() + message;
  const std::scoped_lock lock(log_mutex);
  std::cerr << line << '\n' << std::flush;
}

[[noreturn]] inline void
log_fatal(const std::string& message)
{
  {
    const std::scoped_lock lock(log_mutex);
    std::cerr << "[FATAL] " << detail::tag_prefix() << message << '\n';
  }
  std::exit(EXIT_FAILURE);
}
}  // namespace docpipe
