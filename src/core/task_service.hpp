#pragma once

#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "core/inference_engine.hpp"
#include "core/job.hpp"
#include "core/job_queue.hpp"
#include "core/pipeline.hpp"
#include "core/resource_manager.hpp"
#include "publish/publisher.hpp"
#include "security/rate_limiter.hpp"
#include "security/token_store.hpp"
#include "utils/runtime_config.hpp"

namespace docpipe {

struct TaskView {
  JobSnapshot snapshot;
  std::string result_md;
  std::string result_json;
  std::string result_zip;
};

auto task_view_to_json(const TaskView& view) -> Json::Value;

struct HealthReport {
  struct Limits {
    int max_upload_mb = 0;
    int max_pages = 0;
    int download_chunk_mb = 0;
  };

  double uptime_seconds = 0.0;
  std::size_t queue_size = 0;
  std::size_t queue_capacity = 0;
  std::size_t running_workers = 0;
  std::size_t active_jobs = 0;
  int max_workers = 0;
  std::optional<double> gpu_free_gb;
  std::optional<double> gpu_total_gb;
  std::optional<double> system_memory_free_gb;
  std::optional<double> system_memory_total_gb;
  bool memory_pressure = false;
  std::string compute_backend;
  std::optional<std::string> fallback_reason;
  bool model_enabled = true;
  Limits limits{};
};

auto health_to_json(const HealthReport& report) -> Json::Value;

// =============================================================================
// TaskService: the in-process API behind the transport layer
// -----------------------------------------------------------------------------
// Owns and wires the rate limiter, storage, job queue, pipeline, resource
// manager, publisher and token store. Submission order is rate limit, input
// validation, job directory, queue; a full queue removes the directory again
// and raises QueueFullException.
// =============================================================================
class TaskService {
 public:
  // Everything defaults to the production implementation.
  struct Components {
    std::shared_ptr<const EngineRegistry> registry;
    ResourceManager::Providers providers;
    Pipeline::PageCounter page_counter;
    std::shared_ptr<Publisher> publisher;
    std::shared_ptr<const UrlSigner> signer;
    RateLimiter::TimeSource limiter_clock;
    TokenStore::TimeSource token_clock;
    bool start_background_threads = true;
  };

  explicit TaskService(RuntimeConfig cfg);
  TaskService(RuntimeConfig cfg, Components components);
  ~TaskService();
  TaskService(const TaskService&) = delete;
  auto operator=(const TaskService&) -> TaskService& = delete;
  TaskService(TaskService&&) = delete;
  auto operator=(TaskService&&) -> TaskService& = delete;

  void start();
  void stop();

  // Copies `source` into a new job directory. Returns the task id.
  auto submit_file(
      std::string_view client_key, const std::filesystem::path& source,
      const JobOptions& options) -> std::string;
  auto submit_url(
      std::string_view client_key, const std::string& url,
      const JobOptions& options) -> std::string;

  // In-memory record first, then the status file.
  [[nodiscard]] auto get_task(std::string_view task_id) const
      -> std::optional<TaskView>;
  // Removes a finished job. Throws ValidationException while it is queued or
  // running; returns false for unknown tasks.
  auto delete_task(std::string_view task_id) -> bool;

  auto create_download_token(
      std::string_view task_id, TokenKind kind,
      std::optional<int> max_uses = std::nullopt,
      std::optional<int> ttl_seconds = std::nullopt) -> Token;
  [[nodiscard]] auto consume_download(std::string_view token)
      -> std::optional<ConsumedToken>;

  // Resolves a path below output/images of a task. Throws
  // PathValidationException on traversal.
  [[nodiscard]] auto result_image_path(
      std::string_view task_id, std::string_view relative) const
      -> std::filesystem::path;

  [[nodiscard]] auto health() const -> HealthReport;

  // Applies max_job_retention; returns the number of removed jobs.
  auto sweep_storage() -> std::size_t;

  [[nodiscard]] auto storage_root() const -> const std::filesystem::path&
  {
    return root_;
  }
  [[nodiscard]] auto config() const -> const RuntimeConfig& { return cfg_; }
  [[nodiscard]] auto queue() -> JobQueue& { return *queue_; }
  [[nodiscard]] auto resources() -> ResourceManager& { return *resources_; }
  [[nodiscard]] auto tokens() -> TokenStore& { return *tokens_; }
  [[nodiscard]] auto limiter() -> RateLimiter& { return *limiter_; }

 private:
  void admit(std::string_view client_key);
  void enqueue(const std::shared_ptr<Job>& job);
  void ensure_capacity() const;

  RuntimeConfig cfg_;
  std::filesystem::path root_;
  std::chrono::steady_clock::time_point started_at_;
  std::unique_ptr<RateLimiter> limiter_;
  std::unique_ptr<ResourceManager> resources_;
  std::unique_ptr<Pipeline> pipeline_;
  std::shared_ptr<Publisher> publisher_;
  std::unique_ptr<JobQueue> queue_;
  std::unique_ptr<TokenStore> tokens_;
};

}  // namespace docpipe
