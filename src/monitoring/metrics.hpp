#pragma once

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

#include "monitoring/memory_probe.hpp"

namespace prometheus {
class Exposer;
class Collectable;
template <typename T>
class Family;
}  // namespace prometheus

namespace docpipe {

class MetricsRegistry {
 public:
  struct ExposerHandle {
    ExposerHandle() = default;
    ExposerHandle(const ExposerHandle&) = delete;
    auto operator=(const ExposerHandle&) -> ExposerHandle& = delete;
    ExposerHandle(ExposerHandle&&) = delete;
    auto operator=(ExposerHandle&&) -> ExposerHandle& = delete;
    virtual ~ExposerHandle() = default;
    virtual void RegisterCollectable(
        const std::shared_ptr<prometheus::Collectable>& collectable) = 0;
    virtual void RemoveCollectable(
        const std::shared_ptr<prometheus::Collectable>& collectable) = 0;
  };

  using GpuMemoryProvider = std::function<std::vector<GpuMemorySample>()>;
  using SystemMemoryProvider = std::function<std::optional<MemoryReading>()>;

  explicit MetricsRegistry(int port);
  MetricsRegistry(
      int port, GpuMemoryProvider gpu_provider,
      SystemMemoryProvider system_provider, bool start_sampler_thread = true,
      std::unique_ptr<ExposerHandle> exposer_handle = nullptr);
  ~MetricsRegistry() noexcept;
  MetricsRegistry(const MetricsRegistry&) = delete;
  auto operator=(const MetricsRegistry&) -> MetricsRegistry& = delete;
  MetricsRegistry(MetricsRegistry&&) = delete;
  auto operator=(MetricsRegistry&&) -> MetricsRegistry& = delete;

  std::shared_ptr<prometheus::Registry>
      registry;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* tasks_submitted_total{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* tasks_succeeded_total{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* tasks_failed_total{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* rate_limited_total{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Gauge* job_queue_size{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Gauge* running_workers{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Gauge* inference_in_flight{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Histogram* job_duration_seconds{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Gauge* system_memory_available_bytes{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Gauge>* gpu_memory_free_bytes_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Gauge>* gpu_memory_total_bytes_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)

  void run_sampling_request_nb();
  void request_stop();

 private:
  void initialize(
      int port, bool start_sampler_thread,
      std::unique_ptr<ExposerHandle> exposer_handle);
  void perform_sampling_request_nb();
  void sampling_loop(const std::stop_token& stop);

  std::unique_ptr<ExposerHandle> exposer_;
  std::jthread sampler_thread_;
  GpuMemoryProvider gpu_memory_provider_;
  SystemMemoryProvider system_memory_provider_;
  std::unordered_map<int, prometheus::Gauge*> gpu_memory_free_gauges_;
  std::unordered_map<int, prometheus::Gauge*> gpu_memory_total_gauges_;
};

auto init_metrics(int port) -> bool;
void shutdown_metrics();
auto get_metrics() -> std::shared_ptr<MetricsRegistry>;

// No-ops while metrics are not initialised.
void set_queue_size(std::size_t size);
void set_running_workers(std::size_t count);
void set_inference_in_flight(int count);
void increment_tasks_submitted();
void increment_tasks_succeeded();
void increment_tasks_failed();
void increment_rate_limited();
void observe_job_duration(double seconds);

}  // namespace docpipe
