#include "job_queue.hpp"

#include <format>
#include <stdexcept>
#include <thread>
#include <utility>

#include "core/exception_logging_utils.hpp"
#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace docpipe {

JobQueue::JobQueue(
    const RuntimeConfig& cfg, JobRunner runner,
    std::shared_ptr<Publisher> publisher)
    : capacity_(cfg.scheduling.max_queue_size),
      max_workers_(cfg.scheduling.max_workers),
      poll_interval_(cfg.scheduling.worker_poll_ms),
      stop_timeout_(cfg.scheduling.stop_timeout_ms),
      auto_publish_(cfg.publish.auto_publish), verbosity_(cfg.verbosity),
      runner_(std::move(runner)), publisher_(std::move(publisher))
{
  if (!runner_) {
    throw std::invalid_argument("JobQueue requires a job runner");
  }
}

JobQueue::~JobQueue()
{
  stop();
}

// =============================================================================
// Submission and lookup
// =============================================================================

auto
JobQueue::submit(const std::shared_ptr<Job>& job) -> bool
{
  if (job == nullptr || job->is_shutdown()) {
    return false;
  }
  {
    const std::scoped_lock lock(queue_mutex_);
    if (stopping_ || queue_.size() >= capacity_) {
      return false;
    }
  }

  {
    const std::scoped_lock lock(jobs_mutex_);
    jobs_.insert_or_assign(job->task_id(), job);
  }
  try {
    job->dump_status();
  }
  catch (...) {
    const std::scoped_lock lock(jobs_mutex_);
    jobs_.erase(job->task_id());
    throw;
  }

  bool pushed = false;
  {
    const std::scoped_lock lock(queue_mutex_);
    if (!stopping_ && queue_.size() < capacity_) {
      queue_.push_back(job);
      set_queue_size(queue_.size());
      pushed = true;
    }
  }
  if (!pushed) {
    const std::scoped_lock lock(jobs_mutex_);
    jobs_.erase(job->task_id());
    return false;
  }
  queue_cv_.notify_one();
  increment_tasks_submitted();
  log_debug(verbosity_, std::format("Job {} queued", job->task_id()));
  return true;
}

auto
JobQueue::get(std::string_view task_id) const -> std::shared_ptr<Job>
{
  const std::scoped_lock lock(jobs_mutex_);
  if (const auto it = jobs_.find(task_id); it != jobs_.end()) {
    return it->second;
  }
  return nullptr;
}

auto
JobQueue::forget(std::string_view task_id) -> bool
{
  const std::scoped_lock lock(jobs_mutex_);
  const auto it = jobs_.find(task_id);
  if (it == jobs_.end()) {
    return false;
  }
  const auto status = it->second->status();
  if (status == JobStatus::Queued || status == JobStatus::Processing) {
    return false;
  }
  jobs_.erase(it);
  return true;
}

template <typename Rep, typename Period>
auto
JobQueue::wait_for_and_pop(
    std::shared_ptr<Job>& job,
    const std::chrono::duration<Rep, Period>& timeout) -> bool
{
  std::unique_lock lock(queue_mutex_);
  if (!queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
    return false;
  }
  job = std::move(queue_.front());
  queue_.pop_front();
  set_queue_size(queue_.size());
  return true;
}

// =============================================================================
// Worker pool
// =============================================================================

void
JobQueue::start()
{
  const std::scoped_lock lock(workers_mutex_);
  if (!workers_.empty()) {
    return;
  }
  {
    const std::scoped_lock queue_lock(queue_mutex_);
    stopping_ = false;
  }
  workers_.reserve(static_cast<std::size_t>(max_workers_));
  for (int index = 0; index < max_workers_; ++index) {
    ++live_workers_;
    workers_.emplace_back([this, index](const std::stop_token& stop) {
      worker_loop(stop, index);
    });
  }
  log_info(
      verbosity_, std::format(
                      "Started {} job workers (queue capacity {})",
                      max_workers_, capacity_));
}

void
JobQueue::stop()
{
  std::vector<std::jthread> workers;
  {
    const std::scoped_lock lock(workers_mutex_);
    workers.swap(workers_);
  }
  if (workers.empty()) {
    return;
  }

  {
    const std::scoped_lock lock(queue_mutex_);
    stopping_ = true;
    for (std::size_t i = 0; i < workers.size(); ++i) {
      queue_.push_front(Job::make_shutdown_job());
    }
  }
  queue_cv_.notify_all();
  for (auto& worker : workers) {
    worker.request_stop();
  }

  {
    std::unique_lock lock(workers_mutex_);
    if (!workers_cv_.wait_for(
            lock, stop_timeout_, [this] { return live_workers_ == 0; })) {
      log_warning(std::format(
          "{} job workers still busy after {} ms, waiting for them to finish",
          live_workers_, stop_timeout_.count()));
    }
  }
  for (auto& worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  {
    const std::scoped_lock lock(queue_mutex_);
    std::erase_if(queue_, [](const auto& job) { return job->is_shutdown(); });
    set_queue_size(queue_.size());
  }
  log_info(verbosity_, "Job workers stopped");
}

void
JobQueue::worker_loop(const std::stop_token& stop, int index)
{
  set_thread_log_tag(std::format("worker-{}", index));
  while (!stop.stop_requested()) {
    std::shared_ptr<Job> job;
    if (!wait_for_and_pop(job, poll_interval_)) {
      continue;
    }
    if (job->is_shutdown()) {
      break;
    }
    process(*job);
  }
  clear_thread_log_tag();
  worker_exited();
}

void
JobQueue::worker_exited()
{
  {
    const std::scoped_lock lock(workers_mutex_);
    --live_workers_;
  }
  workers_cv_.notify_all();
}

// =============================================================================
// One job
// =============================================================================

void
JobQueue::process(Job& job)
{
  {
    const std::scoped_lock lock(workers_mutex_);
    set_running_workers(++active_jobs_);
  }
  const auto started = std::chrono::steady_clock::now();
  log_info(verbosity_, std::format("Job {} started", job.task_id()));

  try {
    job.mark_processing();
    job.dump_status();
    runner_(job);
    job.mark_succeeded();
    increment_tasks_succeeded();
    log_info(verbosity_, std::format("Job {} succeeded", job.task_id()));
    if (auto_publish_ && publisher_) {
      publish(job);
    }
  }
  catch (const std::exception& e) {
    const auto error = describe_error(e);
    log_error(std::format(
        "Job {} failed [{}]: {}", job.task_id(), error_kind_name(error.kind),
        error.message));
    if (job.status() == JobStatus::Processing) {
      job.mark_failed(error);
    }
    increment_tasks_failed();
  }

  persist_final_status(job);

  observe_job_duration(std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - started)
                           .count());
  {
    const std::scoped_lock lock(workers_mutex_);
    set_running_workers(--active_jobs_);
  }
  set_queue_size(size());
}

void
JobQueue::persist_final_status(Job& job)
{
  for (int attempt = 1;; ++attempt) {
    try {
      job.dump_status();
      return;
    }
    catch (const std::exception& e) {
      if (attempt < kFinalStatusAttempts) {
        log_warning(std::format(
            "Job {}: final status write {} of {} failed: {}", job.task_id(),
            attempt, kFinalStatusAttempts, e.what()));
        std::this_thread::sleep_for(kFinalStatusRetryDelay * attempt);
        continue;
      }
      const auto error = describe_error(e);
      log_error(std::format(
          "Job {}: final status not persisted [{}]: {}", job.task_id(),
          error_kind_name(error.kind), error.message));
      job.record_persist_failure(error);
      return;
    }
  }
}

void
JobQueue::publish(Job& job)
{
  const auto prefix = std::format("Job {}: publish failed: ", job.task_id());
  const bool published = run_with_logged_exceptions(
      [this, &job] {
        job.set_published(publisher_->publish(job.task_id(), job.paths()));
      },
      ExceptionLoggingMessages{prefix});
  if (published) {
    log_debug(
        verbosity_, std::format(
                        "Job {} published via {}", job.task_id(),
                        publisher_->backend()));
  }
}

// =============================================================================
// Introspection
// =============================================================================

auto
JobQueue::size() const -> std::size_t
{
  const std::scoped_lock lock(queue_mutex_);
  return queue_.size();
}

auto
JobQueue::is_full() const -> bool
{
  const std::scoped_lock lock(queue_mutex_);
  return queue_.size() >= capacity_;
}

auto
JobQueue::running_workers() const -> std::size_t
{
  const std::scoped_lock lock(workers_mutex_);
  return live_workers_;
}

auto
JobQueue::active_jobs() const -> std::size_t
{
  const std::scoped_lock lock(workers_mutex_);
  return active_jobs_;
}

}  // namespace docpipe
