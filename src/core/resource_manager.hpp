#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "core/inference_engine.hpp"
#include "monitoring/memory_probe.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace docpipe {

class ResourceManager;

struct ResourceStatus {
  ComputeDevice device = ComputeDevice::Unknown;
  std::string backend;
  std::optional<std::string> fallback_reason;
  bool loaded = false;
  int in_flight = 0;
  double idle_seconds = 0.0;
};

// =============================================================================
// InferenceLease: scoped, move-only access to the shared engine
// -----------------------------------------------------------------------------
// Destroying (or releasing) the lease decrements the in-flight count, refreshes
// the last-used time and gives back the inference lock when it was taken.
// =============================================================================
class InferenceLease {
 public:
  InferenceLease() = default;
  ~InferenceLease();
  InferenceLease(const InferenceLease&) = delete;
  auto operator=(const InferenceLease&) -> InferenceLease& = delete;
  InferenceLease(InferenceLease&& other) noexcept;
  auto operator=(InferenceLease&& other) noexcept -> InferenceLease&;

  [[nodiscard]] auto engine() const -> InferenceEngine&;
  auto operator->() const -> InferenceEngine* { return &engine(); }
  [[nodiscard]] auto valid() const noexcept -> bool { return owner_ != nullptr; }
  [[nodiscard]] auto holds_inference_lock() const noexcept -> bool
  {
    return holds_lock_;
  }

  void release() noexcept;

 private:
  friend class ResourceManager;
  InferenceLease(
      ResourceManager* owner, std::shared_ptr<InferenceEngine> engine,
      bool holds_lock);

  ResourceManager* owner_ = nullptr;
  std::shared_ptr<InferenceEngine> engine_;
  bool holds_lock_ = false;
};

// =============================================================================
// ResourceManager: owner of the lazily loaded inference engine
// -----------------------------------------------------------------------------
// acquire() runs, in order: the global inference lock (skipped for natively
// concurrent backends), the lazy load with primary -> fallback backend, and
// for GPU engines the memory gate. An idle watcher drops the engine once it
// has been unused for idle_unload_seconds with nothing in flight.
// =============================================================================
class ResourceManager {
 public:
  using Clock = std::chrono::steady_clock;
  using GpuMemoryProvider = std::function<std::optional<MemoryReading>(int)>;
  using SystemMemoryProvider = std::function<std::optional<MemoryReading>()>;
  using GpuAvailabilityProvider = std::function<bool()>;
  using MemoryReclaimer = std::function<void()>;
  using TimeSource = std::function<Clock::time_point()>;

  // Empty members are replaced by the NVML, /proc/meminfo and malloc_trim
  // based defaults.
  struct Providers {
    GpuMemoryProvider gpu_memory;
    SystemMemoryProvider system_memory;
    GpuAvailabilityProvider gpu_available;
    MemoryReclaimer reclaim_memory;
    TimeSource now;
  };

  ResourceManager(
      const RuntimeConfig& cfg, std::shared_ptr<const EngineRegistry> registry,
      Providers providers = {}, bool start_idle_watcher = true);
  ~ResourceManager();
  ResourceManager(const ResourceManager&) = delete;
  auto operator=(const ResourceManager&) -> ResourceManager& = delete;
  ResourceManager(ResourceManager&&) = delete;
  auto operator=(ResourceManager&&) -> ResourceManager& = delete;

  [[nodiscard]] auto acquire(std::chrono::milliseconds timeout)
      -> InferenceLease;
  [[nodiscard]] auto acquire() -> InferenceLease;

  // Allowed concurrent GPU tasks for the current device and free memory.
  [[nodiscard]] auto allowed_concurrency() const -> int;
  [[nodiscard]] auto status() const -> ResourceStatus;
  [[nodiscard]] auto is_loaded() const -> bool;
  [[nodiscard]] auto in_flight() const -> int;

  // One idle-watcher tick. Returns true when the engine was dropped.
  auto check_idle() -> bool;
  void unload();
  void stop();

  [[nodiscard]] auto system_memory() const -> std::optional<MemoryReading>;
  [[nodiscard]] auto gpu_memory() const -> std::optional<MemoryReading>;
  [[nodiscard]] auto memory_pressure() const -> bool;

 private:
  friend class InferenceLease;

  void release(bool holds_lock) noexcept;
  auto ensure_loaded() -> std::shared_ptr<InferenceEngine>;
  auto select_device() const -> ComputeDevice;
  auto allowed_for(ComputeDevice device) const -> int;
  auto lock_with_backoff(Clock::time_point deadline) -> bool;
  void idle_loop(const std::stop_token& stop);
  void publish_in_flight(int value) const;

  RuntimeConfig::SchedulingSettings scheduling_;
  RuntimeConfig::EngineSettings engine_settings_;
  VerbosityLevel verbosity_;
  std::shared_ptr<const EngineRegistry> registry_;
  Providers providers_;

  std::mutex inference_mutex_;
  std::mutex load_mutex_;
  mutable std::mutex mutex_;
  std::shared_ptr<InferenceEngine> engine_;
  int in_flight_ = 0;
  Clock::time_point last_used_;
  ComputeDevice device_ = ComputeDevice::Unknown;
  std::string backend_;
  std::optional<std::string> fallback_reason_;

  std::mutex idle_mutex_;
  std::condition_variable_any idle_cv_;
  std::jthread idle_thread_;
};

}  // namespace docpipe
