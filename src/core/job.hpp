#pragma once

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "storage/job_storage.hpp"
#include "utils/exceptions.hpp"

namespace docpipe {

enum class JobStatus : std::uint8_t {
  Queued,
  Processing,
  Succeeded,
  Failed,
  Canceled
};

auto job_status_name(JobStatus status) -> std::string_view;
auto parse_job_status(std::string_view name) -> std::optional<JobStatus>;

// Conversion options forwarded to the engine and the pipeline.
struct JobOptions {
  bool is_ocr = true;
  bool enable_formula = true;
  bool enable_table = true;
  std::string language = "ch";
  std::optional<std::string> page_ranges;
  std::optional<std::string> model_version;
  bool pack_zip = true;
  bool bbox = true;
};

using JobClock = std::chrono::system_clock;

struct JobSnapshot {
  std::string task_id;
  JobStatus status = JobStatus::Queued;
  JobClock::time_point queued_at{};
  std::optional<JobClock::time_point> started_at;
  std::optional<JobClock::time_point> finished_at;
  std::optional<std::string> message;
  std::optional<ErrorKind> error_kind;
  Json::Value published{Json::nullValue};
};

// Status document written to job_status.json.
auto status_to_json(const JobSnapshot& snapshot) -> Json::Value;
// Inverse of status_to_json; std::nullopt for documents it did not write.
auto status_from_json(const Json::Value& value) -> std::optional<JobSnapshot>;

// =============================================================================
// Job: one document conversion request
// -----------------------------------------------------------------------------
// Identity, paths, input and options are fixed at construction. The status
// part only moves forward (queued -> processing -> succeeded|failed) and is
// guarded by an internal mutex so that readers always see a consistent
// snapshot while the owning worker mutates it.
// =============================================================================
class Job {
 public:
  Job(std::string task_id, JobPaths paths, std::string input_ref, bool is_url,
      JobOptions options,
      JobClock::time_point queued_at = JobClock::now());

  // Worker wake-up marker pushed by JobQueue::stop().
  static auto make_shutdown_job() -> std::shared_ptr<Job>;
  [[nodiscard]] auto is_shutdown() const noexcept -> bool { return shutdown_; }

  [[nodiscard]] auto task_id() const -> const std::string& { return task_id_; }
  [[nodiscard]] auto paths() const -> const JobPaths& { return paths_; }
  [[nodiscard]] auto input_ref() const -> const std::string&
  {
    return input_ref_;
  }
  [[nodiscard]] auto is_url() const noexcept -> bool { return is_url_; }
  [[nodiscard]] auto options() const -> const JobOptions& { return options_; }

  [[nodiscard]] auto status() const -> JobStatus;
  [[nodiscard]] auto snapshot() const -> JobSnapshot;

  void mark_processing(JobClock::time_point now = JobClock::now());
  void mark_succeeded(JobClock::time_point now = JobClock::now());
  void mark_failed(
      const ErrorInfo& error, JobClock::time_point now = JobClock::now());
  void set_published(Json::Value info);
  // Records that the final status write failed. Keeps the status, tags the
  // record with the storage error kind unless an earlier failure set one, and
  // appends the reason to the message.
  void record_persist_failure(const ErrorInfo& error);

  // Writes the current snapshot to job_status.json.
  void dump_status() const;

 private:
  struct ShutdownTag {};
  explicit Job(ShutdownTag /*unused*/);

  void finish(JobStatus status, JobClock::time_point now);

  std::string task_id_;
  JobPaths paths_;
  std::string input_ref_;
  bool is_url_ = false;
  JobOptions options_;
  bool shutdown_ = false;

  mutable std::mutex mutex_;
  JobStatus status_ = JobStatus::Queued;
  JobClock::time_point queued_at_;
  std::optional<JobClock::time_point> started_at_;
  std::optional<JobClock::time_point> finished_at_;
  std::optional<std::string> message_;
  std::optional<ErrorKind> error_kind_;
  Json::Value published_{Json::nullValue};
};

}  // namespace docpipe
