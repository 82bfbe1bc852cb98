#include "task_service.hpp"

#include <format>
#include <system_error>
#include <utility>

#include "core/page_ranges.hpp"
#include "engine/http_engine.hpp"
#include "monitoring/metrics.hpp"
#include "storage/job_storage.hpp"
#include "storage/remote_fetch.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace docpipe {

namespace {

auto
optional_json(const std::optional<double>& value) -> Json::Value
{
  return value ? Json::Value{*value} : Json::Value{Json::nullValue};
}

auto
to_gb(double bytes) -> double
{
  return bytes / kBytesPerGiB;
}

// Last path segment of a URL without query or fragment.
auto
url_filename(std::string_view url) -> std::string
{
  if (const auto scheme = url.find("://"); scheme != std::string_view::npos) {
    url.remove_prefix(scheme + 3);
  }
  if (const auto end = url.find_first_of("?#"); end != std::string_view::npos) {
    url = url.substr(0, end);
  }
  const auto slash = url.find('/');
  if (slash == std::string_view::npos) {
    return {};
  }
  url.remove_prefix(slash);
  const auto last = url.rfind('/');
  return std::string(url.substr(last + 1));
}

auto
default_registry() -> std::shared_ptr<const EngineRegistry>
{
  auto registry = std::make_shared<EngineRegistry>();
  register_builtin_backends(*registry);
  return registry;
}

}  // namespace

auto
task_view_to_json(const TaskView& view) -> Json::Value
{
  auto value = status_to_json(view.snapshot);
  value["result_md"] = view.result_md;
  value["result_json"] = view.result_json;
  value["result_zip"] = view.result_zip;
  return value;
}

auto
health_to_json(const HealthReport& report) -> Json::Value
{
  Json::Value value{Json::objectValue};
  value["status"] = "ok";
  value["uptime_seconds"] = report.uptime_seconds;
  value["queue_size"] = static_cast<Json::UInt64>(report.queue_size);
  value["queue_capacity"] = static_cast<Json::UInt64>(report.queue_capacity);
  value["running_workers"] = static_cast<Json::UInt64>(report.running_workers);
  value["active_jobs"] = static_cast<Json::UInt64>(report.active_jobs);
  value["max_workers"] = report.max_workers;
  value["gpu_free_gb"] = optional_json(report.gpu_free_gb);
  value["gpu_total_gb"] = optional_json(report.gpu_total_gb);
  value["system_memory_free_gb"] = optional_json(report.system_memory_free_gb);
  value["system_memory_total_gb"] =
      optional_json(report.system_memory_total_gb);
  value["memory_pressure"] = report.memory_pressure;
  value["compute_backend"] = report.compute_backend;
  value["fallback_reason"] = report.fallback_reason
                                 ? Json::Value{*report.fallback_reason}
                                 : Json::Value{Json::nullValue};
  value["model_enabled"] = report.model_enabled;
  Json::Value limits{Json::objectValue};
  limits["max_upload_mb"] = report.limits.max_upload_mb;
  limits["max_pages"] = report.limits.max_pages;
  limits["download_chunk_mb"] = report.limits.download_chunk_mb;
  value["limits"] = limits;
  return value;
}

// =============================================================================
// Construction and lifecycle
// =============================================================================

TaskService::TaskService(RuntimeConfig cfg)
    : TaskService(std::move(cfg), Components{})
{
}

TaskService::TaskService(RuntimeConfig cfg, Components components)
    : cfg_(std::move(cfg)), root_(init_storage(cfg_.storage.root)),
      started_at_(std::chrono::steady_clock::now())
{
  auto registry = components.registry ? std::move(components.registry)
                                      : default_registry();
  limiter_ = std::make_unique<RateLimiter>(
      cfg_.rate_limit, std::move(components.limiter_clock),
      components.start_background_threads);
  resources_ = std::make_unique<ResourceManager>(
      cfg_, std::move(registry), std::move(components.providers),
      components.start_background_threads);
  pipeline_ = std::make_unique<Pipeline>(
      cfg_, *resources_, std::move(components.page_counter));

  const bool remote = cfg_.publish.backend == "remote";
  auto signer = components.signer;
  if (remote && !signer) {
    signer = make_url_signer(cfg_.publish);
  }
  publisher_ = components.publisher ? std::move(components.publisher)
                                    : std::shared_ptr<Publisher>(
                                          make_publisher(cfg_));

  queue_ = std::make_unique<JobQueue>(
      cfg_,
      [this](Job& job) {
        pipeline_->run(
            job.input_ref(), job.is_url(), job.paths(), job.options());
      },
      publisher_);

  TokenStore::Options token_options;
  token_options.store_path = cfg_.tokens.store_path;
  token_options.storage_root = root_;
  token_options.backend = remote ? TokenBackend::Remote : TokenBackend::Local;
  token_options.signer = std::move(signer);
  token_options.sign_expire_seconds = cfg_.publish.sign_expire_seconds;
  token_options.now = std::move(components.token_clock);
  tokens_ = std::make_unique<TokenStore>(std::move(token_options));
}

TaskService::~TaskService()
{
  stop();
}

void
TaskService::start()
{
  queue_->start();
}

void
TaskService::stop()
{
  queue_->stop();
  resources_->stop();
  limiter_->stop();
}

// =============================================================================
// Submission
// =============================================================================

void
TaskService::admit(std::string_view client_key)
{
  if (!limiter_->allow(client_key)) {
    increment_rate_limited();
    throw RateLimitedException(
        std::format("Too many requests from '{}'", client_key));
  }
}

void
TaskService::ensure_capacity() const
{
  if (queue_->is_full()) {
    throw QueueFullException("Server busy: task queue is full");
  }
}

void
TaskService::enqueue(const std::shared_ptr<Job>& job)
{
  bool queued = false;
  try {
    queued = queue_->submit(job);
  }
  catch (...) {
    remove_job(root_, job->task_id());
    throw;
  }
  if (!queued) {
    remove_job(root_, job->task_id());
    throw QueueFullException("Server busy: failed to enqueue task");
  }
  log_info(
      cfg_.verbosity,
      std::format(
          "Task {} accepted ({})", job->task_id(),
          job->is_url() ? "url" : "file"));
}

auto
TaskService::submit_file(
    std::string_view client_key, const std::filesystem::path& source,
    const JobOptions& options) -> std::string
{
  admit(client_key);
  if (!cfg_.engine.enabled) {
    throw EngineLoadException("Inference engine is disabled by configuration");
  }
  const auto page_count = pipeline_->validate(source);
  if (options.page_ranges) {
    static_cast<void>(parse_page_ranges(*options.page_ranges, page_count));
  }
  ensure_capacity();

  auto [task_id, paths] = new_job(root_, source.filename().string());
  std::error_code ec;
  std::filesystem::copy_file(
      source, paths.input_file,
      std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    remove_job(root_, task_id);
    throw StorageException(std::format(
        "Cannot store input {}: {}", source.string(), ec.message()));
  }

  auto input = paths.input_file.string();
  auto job = std::make_shared<Job>(
      task_id, std::move(paths), std::move(input), false, options);
  enqueue(job);
  return task_id;
}

auto
TaskService::submit_url(
    std::string_view client_key, const std::string& url,
    const JobOptions& options) -> std::string
{
  admit(client_key);
  if (!cfg_.engine.enabled) {
    throw EngineLoadException("Inference engine is disabled by configuration");
  }
  if (!is_remote_url(url)) {
    throw ValidationException("Only http and https URLs are accepted");
  }
  if (options.page_ranges) {
    static_cast<void>(parse_page_ranges(*options.page_ranges));
  }
  ensure_capacity();

  auto [task_id, paths] = new_job(root_, url_filename(url));
  auto job =
      std::make_shared<Job>(task_id, std::move(paths), url, true, options);
  enqueue(job);
  return task_id;
}

// =============================================================================
// Queries
// =============================================================================

auto
TaskService::get_task(std::string_view task_id) const -> std::optional<TaskView>
{
  validate_task_id(task_id);
  std::optional<JobSnapshot> snapshot;
  if (const auto job = queue_->get(task_id)) {
    snapshot = job->snapshot();
  } else if (const auto stored = load_status(root_, task_id)) {
    snapshot = status_from_json(*stored);
  }
  if (!snapshot) {
    return std::nullopt;
  }
  const auto base = std::format("/v1/tasks/{}", task_id);
  return TaskView{
      std::move(*snapshot), base + "/result.md", base + "/result.json",
      base + "/download.zip"};
}

auto
TaskService::delete_task(std::string_view task_id) -> bool
{
  validate_task_id(task_id);
  if (const auto job = queue_->get(task_id)) {
    const auto status = job->status();
    if (status == JobStatus::Queued || status == JobStatus::Processing) {
      throw ValidationException(std::format(
          "Task {} is {} and cannot be deleted", task_id,
          job_status_name(status)));
    }
    queue_->forget(task_id);
  }
  const bool removed = remove_job(root_, task_id);
  if (removed) {
    log_info(cfg_.verbosity, std::format("Task {} deleted", task_id));
  }
  return removed;
}

auto
TaskService::create_download_token(
    std::string_view task_id, TokenKind kind, std::optional<int> max_uses,
    std::optional<int> ttl_seconds) -> Token
{
  const auto paths = get_job_paths(root_, task_id);
  const auto view = get_task(task_id);
  if (!view) {
    throw ValidationException(std::format("Task {} not found", task_id));
  }
  if (view->snapshot.status != JobStatus::Succeeded) {
    throw ValidationException(std::format(
        "Task {} has no results yet ({})", task_id,
        job_status_name(view->snapshot.status)));
  }

  std::string locator;
  if (tokens_->backend() == TokenBackend::Remote) {
    const auto prefix = remote_object_prefix(cfg_.publish.prefix, task_id);
    switch (kind) {
      case TokenKind::Markdown:
        locator = prefix + "/full.md";
        break;
      case TokenKind::Json:
        locator = prefix + "/layout.json";
        break;
      case TokenKind::Archive:
        locator = prefix + "/result.zip";
        break;
    }
  } else {
    std::filesystem::path file;
    switch (kind) {
      case TokenKind::Markdown:
        file = paths.md_file;
        break;
      case TokenKind::Json:
        file = paths.json_file;
        break;
      case TokenKind::Archive:
        file = paths.zip_file;
        break;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
      throw ValidationException(std::format(
          "Result {} of task {} was not generated", token_kind_name(kind),
          task_id));
    }
    locator = file.string();
  }

  return tokens_->create_token(
      task_id, kind, locator,
      max_uses.value_or(cfg_.tokens.default_max_downloads),
      ttl_seconds.value_or(cfg_.tokens.default_ttl_seconds));
}

auto
TaskService::consume_download(std::string_view token)
    -> std::optional<ConsumedToken>
{
  return tokens_->consume(token);
}

auto
TaskService::result_image_path(
    std::string_view task_id, std::string_view relative) const
    -> std::filesystem::path
{
  const auto paths = get_job_paths(root_, task_id);
  const auto target = validate_path_in_storage(
      paths.images_dir, paths.images_dir / std::filesystem::path(relative));
  return target;
}

auto
TaskService::health() const -> HealthReport
{
  HealthReport report;
  report.uptime_seconds = std::chrono::duration<double>(
                              std::chrono::steady_clock::now() - started_at_)
                              .count();
  report.queue_size = queue_->size();
  report.queue_capacity = queue_->capacity();
  report.running_workers = queue_->running_workers();
  report.active_jobs = queue_->active_jobs();
  report.max_workers = cfg_.scheduling.max_workers;

  const auto gpu = resources_->gpu_memory();
  if (gpu) {
    report.gpu_free_gb = to_gb(gpu->free_bytes);
    report.gpu_total_gb = to_gb(gpu->total_bytes);
  }
  if (const auto system = resources_->system_memory()) {
    report.system_memory_free_gb = to_gb(system->free_bytes);
    report.system_memory_total_gb = to_gb(system->total_bytes);
  }
  report.memory_pressure = resources_->memory_pressure();

  const auto status = resources_->status();
  report.compute_backend = std::string(compute_device_name(status.device));
  if (status.device == ComputeDevice::Unknown) {
    report.compute_backend = gpu ? "gpu" : "cpu";
  }
  report.fallback_reason = status.fallback_reason;
  report.model_enabled = cfg_.engine.enabled;
  report.limits.max_upload_mb = cfg_.limits.max_upload_mb;
  report.limits.max_pages = cfg_.limits.max_pages;
  report.limits.download_chunk_mb = cfg_.limits.download_chunk_mb;
  return report;
}

auto
TaskService::sweep_storage() -> std::size_t
{
  const auto removed = cleanup_old_jobs(root_, cfg_.storage.max_job_retention);
  if (removed > 0) {
    log_info(
        cfg_.verbosity, std::format("Removed {} expired job directories", removed));
  }
  return removed;
}

}  // namespace docpipe
