#include "resource_manager.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <thread>
#include <utility>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"

namespace docpipe {

// =============================================================================
// InferenceLease
// =============================================================================

InferenceLease::InferenceLease(
    ResourceManager* owner, std::shared_ptr<InferenceEngine> engine,
    bool holds_lock)
    : owner_(owner), engine_(std::move(engine)), holds_lock_(holds_lock)
{
}

InferenceLease::~InferenceLease()
{
  release();
}

InferenceLease::InferenceLease(InferenceLease&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)),
      engine_(std::move(other.engine_)),
      holds_lock_(std::exchange(other.holds_lock_, false))
{
}

auto
InferenceLease::operator=(InferenceLease&& other) noexcept -> InferenceLease&
{
  if (this != &other) {
    release();
    owner_ = std::exchange(other.owner_, nullptr);
    engine_ = std::move(other.engine_);
    holds_lock_ = std::exchange(other.holds_lock_, false);
  }
  return *this;
}

auto
InferenceLease::engine() const -> InferenceEngine&
{
  if (!engine_) {
    throw std::logic_error("InferenceLease does not hold an engine");
  }
  return *engine_;
}

void
InferenceLease::release() noexcept
{
  if (owner_ == nullptr) {
    return;
  }
  engine_.reset();
  owner_->release(holds_lock_);
  owner_ = nullptr;
  holds_lock_ = false;
}

// =============================================================================
// ResourceManager
// =============================================================================

ResourceManager::ResourceManager(
    const RuntimeConfig& cfg, std::shared_ptr<const EngineRegistry> registry,
    Providers providers, bool start_idle_watcher)
    : scheduling_(cfg.scheduling), engine_settings_(cfg.engine),
      verbosity_(cfg.verbosity), registry_(std::move(registry)),
      providers_(std::move(providers)), backend_(cfg.engine.backend)
{
  if (!registry_) {
    throw std::invalid_argument("ResourceManager requires an engine registry");
  }
  if (!providers_.gpu_memory) {
    providers_.gpu_memory = query_gpu_memory;
  }
  if (!providers_.system_memory) {
    providers_.system_memory = query_system_memory;
  }
  if (!providers_.gpu_available) {
    providers_.gpu_available = gpu_available;
  }
  if (!providers_.reclaim_memory) {
    providers_.reclaim_memory = reclaim_process_memory;
  }
  if (!providers_.now) {
    providers_.now = [] { return Clock::now(); };
  }
  last_used_ = providers_.now();

  if (start_idle_watcher) {
    idle_thread_ = std::jthread(
        [this](const std::stop_token& stop) { this->idle_loop(stop); });
  }
}

ResourceManager::~ResourceManager()
{
  stop();
  const std::scoped_lock lock(mutex_);
  engine_.reset();
}

auto
ResourceManager::acquire() -> InferenceLease
{
  return acquire(std::chrono::seconds(scheduling_.acquire_timeout_seconds));
}

auto
ResourceManager::acquire(std::chrono::milliseconds timeout) -> InferenceLease
{
  const auto started = Clock::now();
  const auto deadline = started + timeout;
  bool holds_lock = false;
  const auto drop_lock = [this, &holds_lock] {
    if (holds_lock) {
      inference_mutex_.unlock();
      holds_lock = false;
    }
  };

  bool known_concurrent = false;
  {
    const std::scoped_lock lock(mutex_);
    known_concurrent = engine_ && engine_->natively_concurrent();
  }

  // (a) global serialisation
  if (!known_concurrent) {
    if (!lock_with_backoff(deadline)) {
      throw AcquisitionTimeoutException(std::format(
          "Timed out after {} ms waiting for the inference lock",
          timeout.count()));
    }
    holds_lock = true;
  }

  auto backoff = std::chrono::milliseconds(scheduling_.poll_interval_ms);
  const auto max_backoff =
      std::chrono::milliseconds(scheduling_.max_poll_interval_ms);
  bool warned_pressure = false;

  try {
    while (true) {
      // (b) lazy load
      auto engine = ensure_loaded();

      if (engine->natively_concurrent()) {
        drop_lock();
        const std::scoped_lock lock(mutex_);
        if (engine_ != engine) {
          continue;
        }
        ++in_flight_;
        last_used_ = providers_.now();
        publish_in_flight(in_flight_);
        return InferenceLease(this, std::move(engine), false);
      }

      if (!holds_lock) {
        if (!lock_with_backoff(deadline)) {
          throw AcquisitionTimeoutException(std::format(
              "Timed out after {} ms waiting for the inference lock",
              timeout.count()));
        }
        holds_lock = true;
      }

      // (c) memory gate
      bool under_pressure = false;
      {
        const std::scoped_lock lock(mutex_);
        if (engine_ != engine) {
          continue;
        }
        const bool gated = device_ == ComputeDevice::Gpu;
        under_pressure = gated && memory_pressure();
        if (!under_pressure) {
          const int allowed = gated ? allowed_for(device_) : 1;
          if (!gated || in_flight_ < allowed) {
            ++in_flight_;
            last_used_ = providers_.now();
            publish_in_flight(in_flight_);
            return InferenceLease(this, std::move(engine), holds_lock);
          }
        }
      }

      if (under_pressure && !warned_pressure) {
        warned_pressure = true;
        log_warning(std::format(
            "System memory below {:.2f} GB; waiting before admitting a job",
            scheduling_.min_system_memory_gb));
      }
      const auto now = Clock::now();
      if (now >= deadline) {
        throw AcquisitionTimeoutException(std::format(
            "Timed out after {} ms waiting for GPU memory", timeout.count()));
      }
      const auto remaining =
          std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
      std::this_thread::sleep_for(std::min(backoff, remaining));
      backoff = std::min(backoff * 2, max_backoff);
    }
  }
  catch (...) {
    drop_lock();
    throw;
  }
}

auto
ResourceManager::lock_with_backoff(Clock::time_point deadline) -> bool
{
  auto backoff = std::chrono::milliseconds(scheduling_.poll_interval_ms);
  const auto max_backoff =
      std::chrono::milliseconds(scheduling_.max_poll_interval_ms);
  while (!inference_mutex_.try_lock()) {
    const auto now = Clock::now();
    if (now >= deadline) {
      return false;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(backoff, remaining));
    backoff = std::min(backoff * 2, max_backoff);
  }
  return true;
}

void
ResourceManager::release(bool holds_lock) noexcept
{
  {
    const std::scoped_lock lock(mutex_);
    in_flight_ = std::max(0, in_flight_ - 1);
    last_used_ = providers_.now();
    publish_in_flight(in_flight_);
  }
  if (holds_lock) {
    inference_mutex_.unlock();
  }
}

auto
ResourceManager::select_device() const -> ComputeDevice
{
  if (scheduling_.force_cpu) {
    log_info(verbosity_, "Runtime device selected: cpu (forced)");
    return ComputeDevice::Cpu;
  }
  if (providers_.gpu_available()) {
    log_info(verbosity_, "Runtime device selected: gpu");
    return ComputeDevice::Gpu;
  }
  log_info(verbosity_, "Runtime device selected: cpu (no accelerator)");
  return ComputeDevice::Cpu;
}

auto
ResourceManager::ensure_loaded() -> std::shared_ptr<InferenceEngine>
{
  {
    const std::scoped_lock lock(mutex_);
    if (engine_) {
      return engine_;
    }
  }

  const std::scoped_lock load_lock(load_mutex_);
  {
    const std::scoped_lock lock(mutex_);
    if (engine_) {
      return engine_;
    }
  }

  if (!engine_settings_.enabled) {
    throw EngineLoadException("Inference engine is disabled by configuration");
  }

  const ComputeDevice device = select_device();
  EngineBuildContext context{device, engine_settings_};
  const std::string& primary = engine_settings_.backend;
  const std::string& fallback = engine_settings_.fallback_backend;

  std::shared_ptr<InferenceEngine> engine;
  std::string backend = primary;
  std::optional<std::string> fallback_reason;

  const auto record_failure = [this](const std::string& reason) {
    const std::scoped_lock lock(mutex_);
    device_ = ComputeDevice::Unknown;
    fallback_reason_ = reason;
  };

  try {
    engine = registry_->create(primary, context);
  }
  catch (const std::exception& primary_error) {
    if (fallback.empty() || fallback == primary) {
      const auto reason = std::format("load failed: {}", primary_error.what());
      record_failure(reason);
      log_error(reason);
      throw EngineLoadException(reason);
    }

    fallback_reason =
        std::format("{} init failed: {}", primary, primary_error.what());
    log_warning(std::format(
        "{}; falling back to backend '{}'", *fallback_reason, fallback));
    try {
      engine = registry_->create(fallback, context);
      backend = fallback;
    }
    catch (const std::exception& fallback_error) {
      const auto reason =
          std::format("load failed: {}", fallback_error.what());
      record_failure(reason);
      log_error(reason);
      throw EngineLoadException(reason);
    }
  }

  {
    const std::scoped_lock lock(mutex_);
    engine_ = engine;
    device_ = device;
    backend_ = backend;
    fallback_reason_ = std::move(fallback_reason);
    last_used_ = providers_.now();
  }
  log_info(
      verbosity_, std::format(
                      "Engine loaded (backend={}, device={})", backend,
                      compute_device_name(device)));
  return engine;
}

auto
ResourceManager::allowed_concurrency() const -> int
{
  ComputeDevice device = ComputeDevice::Unknown;
  {
    const std::scoped_lock lock(mutex_);
    device = device_;
  }
  return allowed_for(device);
}

auto
ResourceManager::allowed_for(ComputeDevice device) const -> int
{
  if (!scheduling_.dynamic_workers || device != ComputeDevice::Gpu) {
    return 1;
  }
  const auto memory = providers_.gpu_memory(scheduling_.gpu_index);
  if (!memory) {
    return 1;
  }

  const double reserve =
      std::max(0.0, scheduling_.reserve_gpu_mem_gb) * kBytesPerGiB;
  const double per_job =
      std::max(0.1, scheduling_.mem_per_job_gb) * kBytesPerGiB;
  const double usable = std::max(0.0, memory->free_bytes - reserve);
  const auto allowed = static_cast<long long>(std::floor(usable / per_job));
  const auto clamped = std::clamp<long long>(
      allowed, 1, std::max(1, scheduling_.max_workers));

  log_debug(
      verbosity_,
      std::format(
          "GPU memory check: free={:.2f}GB reserve={:.2f}GB per_job={:.2f}GB "
          "allowed={}",
          memory->free_bytes / kBytesPerGiB, reserve / kBytesPerGiB,
          per_job / kBytesPerGiB, clamped));
  return static_cast<int>(clamped);
}

auto
ResourceManager::system_memory() const -> std::optional<MemoryReading>
{
  return providers_.system_memory();
}

auto
ResourceManager::gpu_memory() const -> std::optional<MemoryReading>
{
  return providers_.gpu_memory(scheduling_.gpu_index);
}

auto
ResourceManager::memory_pressure() const -> bool
{
  const auto memory = providers_.system_memory();
  if (!memory) {
    return false;
  }
  return memory->free_bytes < scheduling_.min_system_memory_gb * kBytesPerGiB;
}

auto
ResourceManager::status() const -> ResourceStatus
{
  const std::scoped_lock lock(mutex_);
  ResourceStatus status;
  status.device = device_;
  status.backend = backend_;
  status.fallback_reason = fallback_reason_;
  status.loaded = static_cast<bool>(engine_);
  status.in_flight = in_flight_;
  status.idle_seconds =
      std::chrono::duration<double>(providers_.now() - last_used_).count();
  return status;
}

auto
ResourceManager::is_loaded() const -> bool
{
  const std::scoped_lock lock(mutex_);
  return static_cast<bool>(engine_);
}

auto
ResourceManager::in_flight() const -> int
{
  const std::scoped_lock lock(mutex_);
  return in_flight_;
}

auto
ResourceManager::check_idle() -> bool
{
  std::shared_ptr<InferenceEngine> dropped;
  double idle_seconds = 0.0;
  {
    const std::scoped_lock lock(mutex_);
    if (!engine_ || in_flight_ > 0) {
      return false;
    }
    idle_seconds =
        std::chrono::duration<double>(providers_.now() - last_used_).count();
    if (idle_seconds < static_cast<double>(scheduling_.idle_unload_seconds)) {
      return false;
    }
    dropped = std::exchange(engine_, nullptr);
  }
  dropped.reset();
  providers_.reclaim_memory();
  log_info(
      verbosity_,
      std::format("Engine unloaded after {:.0f}s idle", idle_seconds));
  return true;
}

void
ResourceManager::unload()
{
  std::shared_ptr<InferenceEngine> dropped;
  {
    const std::scoped_lock lock(mutex_);
    dropped = std::exchange(engine_, nullptr);
  }
  if (dropped) {
    dropped.reset();
    providers_.reclaim_memory();
    log_info(verbosity_, "Engine unloaded");
  }
}

void
ResourceManager::stop()
{
  if (idle_thread_.joinable()) {
    idle_thread_.request_stop();
    idle_cv_.notify_all();
    idle_thread_.join();
  }
}

void
ResourceManager::idle_loop(const std::stop_token& stop)
{
  set_thread_log_tag("idle-watcher");
  const auto interval =
      std::chrono::milliseconds(scheduling_.idle_check_interval_ms);
  std::unique_lock lock(idle_mutex_);
  while (!stop.stop_requested()) {
    idle_cv_.wait_for(lock, stop, interval, [] { return false; });
    if (stop.stop_requested()) {
      break;
    }
    lock.unlock();
    try {
      check_idle();
    }
    catch (const std::exception& e) {
      log_error(std::format("Idle unload failed: {}", e.what()));
    }
    lock.lock();
  }
}

void
ResourceManager::publish_in_flight(int value) const
{
  set_inference_in_flight(value);
}

}  // namespace docpipe
