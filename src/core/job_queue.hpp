#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "core/job.hpp"
#include "publish/publisher.hpp"
#include "utils/runtime_config.hpp"
#include "utils/transparent_hash.hpp"

namespace docpipe {

// =============================================================================
// JobQueue: bounded FIFO of jobs served by a fixed pool of worker threads
// -----------------------------------------------------------------------------
// submit() never blocks: it returns false when the queue holds max_queue_size
// jobs. Workers pop with a bounded wait so that stop() is noticed within one
// poll period; stop() wakes them with sentinels placed ahead of any queued
// job, which stays queued on disk. The runner does the actual conversion; a failing runner marks
// the job failed but never ends the worker.
// =============================================================================
class JobQueue {
 public:
  using JobRunner = std::function<void(Job&)>;

  JobQueue(
      const RuntimeConfig& cfg, JobRunner runner,
      std::shared_ptr<Publisher> publisher = nullptr);
  ~JobQueue();
  JobQueue(const JobQueue&) = delete;
  auto operator=(const JobQueue&) -> JobQueue& = delete;
  JobQueue(JobQueue&&) = delete;
  auto operator=(JobQueue&&) -> JobQueue& = delete;

  [[nodiscard]] auto submit(const std::shared_ptr<Job>& job) -> bool;
  [[nodiscard]] auto get(std::string_view task_id) const
      -> std::shared_ptr<Job>;
  // Drops the in-memory record of a job that is not queued or running.
  auto forget(std::string_view task_id) -> bool;

  void start();
  void stop();

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto capacity() const noexcept -> std::size_t
  {
    return capacity_;
  }
  [[nodiscard]] auto is_full() const -> bool;
  // Worker threads alive.
  [[nodiscard]] auto running_workers() const -> std::size_t;
  // Workers currently busy with a job.
  [[nodiscard]] auto active_jobs() const -> std::size_t;

 private:
  template <typename Rep, typename Period>
  auto wait_for_and_pop(
      std::shared_ptr<Job>& job,
      const std::chrono::duration<Rep, Period>& timeout) -> bool;

  void worker_loop(const std::stop_token& stop, int index);
  void process(Job& job);
  void publish(Job& job);
  // Retries the terminal status write; a write that keeps failing is
  // recorded on the in-memory job so status queries still report it.
  void persist_final_status(Job& job);
  void worker_exited();

  static constexpr int kFinalStatusAttempts = 3;
  static constexpr std::chrono::milliseconds kFinalStatusRetryDelay{20};

  std::size_t capacity_;
  int max_workers_;
  std::chrono::milliseconds poll_interval_;
  std::chrono::milliseconds stop_timeout_;
  bool auto_publish_;
  VerbosityLevel verbosity_;
  JobRunner runner_;
  std::shared_ptr<Publisher> publisher_;

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<std::shared_ptr<Job>> queue_;
  bool stopping_ = false;

  mutable std::mutex jobs_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Job>, TransparentHash,
                     std::equal_to<>>
      jobs_;

  mutable std::mutex workers_mutex_;
  std::condition_variable workers_cv_;
  std::size_t live_workers_ = 0;
  std::size_t active_jobs_ = 0;
  std::vector<std::jthread> workers_;
};

}  // namespace docpipe
