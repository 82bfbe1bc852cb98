#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docpipe {

// Stable, serialisable failure categories. The string form is what ends up in
// job status files as "error_kind".
enum class ErrorKind : std::uint8_t {
  Internal = 0,
  QueueFull,
  RateLimited,
  Validation,
  Timeout,
  EngineLoad,
  Engine,
  Download,
  Publish,
  Storage,
  State
};

auto error_kind_name(ErrorKind kind) -> std::string_view;
auto parse_error_kind(std::string_view name) -> std::optional<ErrorKind>;

// =============================================================================
// Base class for all docpipe exceptions
// =============================================================================

class DocpipeException : public std::runtime_error {
 public:
  DocpipeException(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind)
  {
  }

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

 private:
  ErrorKind kind_;
};

// =============================================================================
// Admission errors: the job is never created
// =============================================================================

/// Thrown when the job queue is at capacity
class QueueFullException : public DocpipeException {
 public:
  explicit QueueFullException(const std::string& message)
      : DocpipeException(ErrorKind::QueueFull, message)
  {
  }
};

/// Thrown when a client exhausted its token bucket
class RateLimitedException : public DocpipeException {
 public:
  explicit RateLimitedException(const std::string& message)
      : DocpipeException(ErrorKind::RateLimited, message)
  {
  }
};

// =============================================================================
// Validation errors: raised before any engine work
// =============================================================================

class ValidationException : public DocpipeException {
 public:
  explicit ValidationException(const std::string& message)
      : DocpipeException(ErrorKind::Validation, message)
  {
  }
};

/// Thrown when an upload or download exceeds the size ceiling
class FileTooLargeException : public ValidationException {
 public:
  using ValidationException::ValidationException;
};

/// Thrown when a paginated document has more pages than allowed
class PageLimitExceededException : public ValidationException {
 public:
  using ValidationException::ValidationException;
};

/// Thrown when a task identifier is not a canonical UUID
class InvalidTaskIdException : public ValidationException {
 public:
  using ValidationException::ValidationException;
};

/// Thrown when a path escapes the trusted storage root
class PathValidationException : public ValidationException {
 public:
  using ValidationException::ValidationException;
};

// =============================================================================
// Resource and engine errors
// =============================================================================

/// Thrown when the inference lock or a memory slot was not obtained in time
class AcquisitionTimeoutException : public DocpipeException {
 public:
  explicit AcquisitionTimeoutException(const std::string& message)
      : DocpipeException(ErrorKind::Timeout, message)
  {
  }
};

/// Thrown when neither the primary nor the fallback backend could be built
class EngineLoadException : public DocpipeException {
 public:
  explicit EngineLoadException(const std::string& message)
      : DocpipeException(ErrorKind::EngineLoad, message)
  {
  }
};

/// Thrown when a predict call fails
class EngineExecutionException : public DocpipeException {
 public:
  explicit EngineExecutionException(const std::string& message)
      : DocpipeException(ErrorKind::Engine, message)
  {
  }
};

/// Thrown when a remote input cannot be fetched
class DownloadException : public DocpipeException {
 public:
  explicit DownloadException(const std::string& message)
      : DocpipeException(ErrorKind::Download, message)
  {
  }
};

/// Thrown when publishing results fails; never escapes a worker
class PublishException : public DocpipeException {
 public:
  explicit PublishException(const std::string& message)
      : DocpipeException(ErrorKind::Publish, message)
  {
  }
};

/// Thrown when a file cannot be written, renamed or archived
class StorageException : public DocpipeException {
 public:
  explicit StorageException(const std::string& message)
      : DocpipeException(ErrorKind::Storage, message)
  {
  }
};

/// Thrown on a backwards or repeated job status transition
class InvalidJobTransitionException : public DocpipeException {
 public:
  explicit InvalidJobTransitionException(const std::string& message)
      : DocpipeException(ErrorKind::State, message)
  {
  }
};

// =============================================================================
// Serialisable description of any failure
// =============================================================================

struct ErrorInfo {
  ErrorKind kind = ErrorKind::Internal;
  std::string message;
};

auto describe_error(const std::exception& error) -> ErrorInfo;

}  // namespace docpipe
