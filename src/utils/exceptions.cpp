#include "exceptions.hpp"

#include <filesystem>
#include <new>

namespace docpipe {

auto
error_kind_name(ErrorKind kind) -> std::string_view
{
  using enum ErrorKind;
  switch (kind) {
    case QueueFull:
      return "queue_full";
    case RateLimited:
      return "rate_limited";
    case Validation:
      return "validation";
    case Timeout:
      return "timeout";
    case EngineLoad:
      return "engine_load";
    case Engine:
      return "engine";
    case Download:
      return "download";
    case Publish:
      return "publish";
    case Storage:
      return "storage";
    case State:
      return "state";
    case Internal:
      break;
  }
  return "internal";
}

auto
parse_error_kind(std::string_view name) -> std::optional<ErrorKind>
{
  using enum ErrorKind;
  for (const auto kind :
       {Internal, QueueFull, RateLimited, Validation, Timeout, EngineLoad,
        Engine, Download, Publish, Storage, State}) {
    if (error_kind_name(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

auto
describe_error(const std::exception& error) -> ErrorInfo
{
  if (const auto* known = dynamic_cast<const DocpipeException*>(&error)) {
    return ErrorInfo{known->kind(), known->what()};
  }
  if (dynamic_cast<const std::filesystem::filesystem_error*>(&error) !=
      nullptr) {
    return ErrorInfo{ErrorKind::Storage, error.what()};
  }
  if (dynamic_cast<const std::bad_alloc*>(&error) != nullptr) {
    return ErrorInfo{ErrorKind::Internal, "out of memory"};
  }
  return ErrorInfo{ErrorKind::Internal, error.what()};
}

}  // namespace docpipe
