#include "job.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "utils/time_utils.hpp"

namespace docpipe {

auto
job_status_name(JobStatus status) -> std::string_view
{
  using enum JobStatus;
  switch (status) {
    case Queued:
      return "queued";
    case Processing:
      return "processing";
    case Succeeded:
      return "succeeded";
    case Failed:
      return "failed";
    case Canceled:
      return "canceled";
  }
  return "unknown";
}

auto
parse_job_status(std::string_view name) -> std::optional<JobStatus>
{
  using enum JobStatus;
  for (const auto status : {Queued, Processing, Succeeded, Failed, Canceled}) {
    if (job_status_name(status) == name) {
      return status;
    }
  }
  return std::nullopt;
}

namespace {

auto
optional_epoch(const std::optional<JobClock::time_point>& time_point)
    -> Json::Value
{
  if (!time_point) {
    return Json::Value{Json::nullValue};
  }
  return Json::Value{time_utils::to_epoch_seconds(*time_point)};
}

}  // namespace

auto
status_to_json(const JobSnapshot& snapshot) -> Json::Value
{
  Json::Value root{Json::objectValue};
  root["task_id"] = snapshot.task_id;
  root["status"] = std::string(job_status_name(snapshot.status));
  root["queued_at"] = time_utils::to_epoch_seconds(snapshot.queued_at);
  root["started_at"] = optional_epoch(snapshot.started_at);
  root["finished_at"] = optional_epoch(snapshot.finished_at);
  root["message"] = snapshot.message ? Json::Value{*snapshot.message}
                                     : Json::Value{Json::nullValue};
  if (snapshot.error_kind) {
    root["error_kind"] = std::string(error_kind_name(*snapshot.error_kind));
  }
  if (!snapshot.published.isNull()) {
    root["published"] = snapshot.published;
  }
  return root;
}

auto
status_from_json(const Json::Value& value) -> std::optional<JobSnapshot>
{
  if (!value.isObject() || !value["task_id"].isString() ||
      !value["status"].isString()) {
    return std::nullopt;
  }
  const auto status = parse_job_status(value["status"].asString());
  if (!status) {
    return std::nullopt;
  }
  const auto epoch = [&value](const char* key)
      -> std::optional<JobClock::time_point> {
    if (!value[key].isNumeric()) {
      return std::nullopt;
    }
    return time_utils::from_epoch_seconds(value[key].asDouble());
  };

  JobSnapshot snap;
  snap.task_id = value["task_id"].asString();
  snap.status = *status;
  snap.queued_at = epoch("queued_at").value_or(JobClock::time_point{});
  snap.started_at = epoch("started_at");
  snap.finished_at = epoch("finished_at");
  if (value["message"].isString()) {
    snap.message = value["message"].asString();
  }
  if (value["error_kind"].isString()) {
    snap.error_kind = parse_error_kind(value["error_kind"].asString());
  }
  if (value.isMember("published")) {
    snap.published = value["published"];
  }
  return snap;
}

Job::Job(
    std::string task_id, JobPaths paths, std::string input_ref, bool is_url,
    JobOptions options, JobClock::time_point queued_at)
    : task_id_(std::move(task_id)), paths_(std::move(paths)),
      input_ref_(std::move(input_ref)), is_url_(is_url),
      options_(std::move(options)), queued_at_(queued_at)
{
}

Job::Job(ShutdownTag /*unused*/) : shutdown_(true) {}

auto
Job::make_shutdown_job() -> std::shared_ptr<Job>
{
  return std::shared_ptr<Job>(new Job(ShutdownTag{}));
}

auto
Job::status() const -> JobStatus
{
  const std::scoped_lock lock(mutex_);
  return status_;
}

auto
Job::snapshot() const -> JobSnapshot
{
  const std::scoped_lock lock(mutex_);
  JobSnapshot snap;
  snap.task_id = task_id_;
  snap.status = status_;
  snap.queued_at = queued_at_;
  snap.started_at = started_at_;
  snap.finished_at = finished_at_;
  snap.message = message_;
  snap.error_kind = error_kind_;
  snap.published = published_;
  return snap;
}

void
Job::mark_processing(JobClock::time_point now)
{
  const std::scoped_lock lock(mutex_);
  if (status_ != JobStatus::Queued || started_at_) {
    throw InvalidJobTransitionException(std::format(
        "Job {}: cannot move from {} to processing", task_id_,
        job_status_name(status_)));
  }
  status_ = JobStatus::Processing;
  started_at_ = std::max(now, queued_at_);
}

void
Job::finish(JobStatus status, JobClock::time_point now)
{
  if (status_ != JobStatus::Processing || !started_at_ || finished_at_) {
    throw InvalidJobTransitionException(std::format(
        "Job {}: cannot move from {} to {}", task_id_, job_status_name(status_),
        job_status_name(status)));
  }
  status_ = status;
  finished_at_ = std::max(now, *started_at_);
}

void
Job::mark_succeeded(JobClock::time_point now)
{
  const std::scoped_lock lock(mutex_);
  finish(JobStatus::Succeeded, now);
}

void
Job::mark_failed(const ErrorInfo& error, JobClock::time_point now)
{
  const std::scoped_lock lock(mutex_);
  finish(JobStatus::Failed, now);
  message_ = error.message;
  error_kind_ = error.kind;
}

void
Job::set_published(Json::Value info)
{
  const std::scoped_lock lock(mutex_);
  published_ = std::move(info);
}

void
Job::record_persist_failure(const ErrorInfo& error)
{
  const std::scoped_lock lock(mutex_);
  if (!error_kind_) {
    error_kind_ = ErrorKind::Storage;
  }
  const auto note = std::format("status not persisted: {}", error.message);
  message_ = message_ ? std::format("{}; {}", *message_, note) : note;
}

void
Job::dump_status() const
{
  save_status(paths_, status_to_json(snapshot()));
}

}  // namespace docpipe
