#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>

#include "logger.hpp"
#include "transparent_hash.hpp"

namespace docpipe {
// =============================================================================
// Compile-time defaults
// =============================================================================
inline constexpr std::size_t kBytesPerKiB = 1024ULL;
inline constexpr std::size_t kBytesPerMiB = kBytesPerKiB * 1024ULL;
inline constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;
inline constexpr int kDefaultMetricsPort = 9090;
inline constexpr int kDefaultMaxWorkers = 1;
inline constexpr std::size_t kDefaultMaxQueueSize = 100;
inline constexpr int kDefaultMaxUploadMb = 200;
inline constexpr int kDefaultMaxPages = 500;
inline constexpr int kDefaultBatchPageSize = 50;

inline const std::unordered_set<std::string, TransparentHash, std::equal_to<>>
    kAllowedPublishBackends = {"local", "remote"};

// =============================================================================
// RuntimeConfig
// -----------------------------------------------------------------------------
// Process-wide configuration, loaded once from YAML at startup and passed by
// const reference to every component. Memory quantities are in GiB, sizes of
// files in MiB, durations in the unit named by the field.
// =============================================================================
struct RuntimeConfig {
  struct StorageSettings {
    std::string root = "data/jobs";
    std::size_t max_job_retention = 1000;
    int retention_sweep_seconds = 3600;
    int inbox_scan_interval_ms = 1000;
  };

  struct SchedulingSettings {
    int max_workers = kDefaultMaxWorkers;
    std::size_t max_queue_size = kDefaultMaxQueueSize;
    bool dynamic_workers = true;
    double mem_per_job_gb = 8.0;
    double reserve_gpu_mem_gb = 1.0;
    double min_system_memory_gb = 2.0;
    int gpu_index = 0;
    bool force_cpu = false;
    int idle_unload_seconds = 600;
    int idle_check_interval_ms = 1000;
    int acquire_timeout_seconds = 180;
    int poll_interval_ms = 50;
    int max_poll_interval_ms = 500;
    int worker_poll_ms = 500;
    int stop_timeout_ms = 1000;
  };

  struct LimitSettings {
    int max_upload_mb = kDefaultMaxUploadMb;
    int max_pages = kDefaultMaxPages;
    int download_chunk_mb = 4;
    int download_timeout_seconds = 60;
  };

  struct BatchingSettings {
    bool enable_auto_batch = true;
    int batch_page_size = kDefaultBatchPageSize;
  };

  struct EngineSettings {
    std::string backend = "http";
    std::string fallback_backend;
    std::string endpoint = "http://127.0.0.1:8001";
    std::string model_path;
    int request_timeout_seconds = 600;
    bool enabled = true;
  };

  struct PublishSettings {
    std::string backend = "local";
    bool auto_publish = false;
    std::string endpoint;
    std::string bucket;
    std::string access_key_id;
    std::string access_key_secret;
    std::string prefix = "docpipe";
    int sign_expire_seconds = 3600;
  };

  struct TokenSettings {
    std::string store_path = "data/tokens/tokens.json";
    int default_ttl_seconds = 3600;
    int default_max_downloads = 1;
  };

  struct RateLimitSettings {
    bool enabled = true;
    double rate_per_second = 10.0;
    int burst = 20;
    int bucket_ttl_seconds = 300;
    int sweep_interval_seconds = 60;
  };

  std::string config_path;
  int metrics_port = kDefaultMetricsPort;
  bool metrics_enabled = true;
  VerbosityLevel verbosity = VerbosityLevel::Info;

  StorageSettings storage{};
  SchedulingSettings scheduling{};
  LimitSettings limits{};
  BatchingSettings batching{};
  EngineSettings engine{};
  PublishSettings publish{};
  TokenSettings tokens{};
  RateLimitSettings rate_limit{};
  bool valid = true;
};

inline auto
max_upload_bytes(const RuntimeConfig& cfg) -> std::uintmax_t
{
  const auto megabytes = cfg.limits.max_upload_mb > 0
                             ? static_cast<std::uintmax_t>(cfg.limits.max_upload_mb)
                             : 1U;
  return megabytes * kBytesPerMiB;
}

}  // namespace docpipe
