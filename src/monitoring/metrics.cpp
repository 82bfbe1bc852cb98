#include "monitoring/metrics.hpp"

#include <prometheus/exposer.h>
#include <prometheus/histogram.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "utils/logger.hpp"

namespace docpipe {

class PrometheusExposerHandle : public MetricsRegistry::ExposerHandle {
 public:
  explicit PrometheusExposerHandle(std::unique_ptr<prometheus::Exposer> exposer)
      : exposer_(std::move(exposer))
  {
  }

  void RegisterCollectable(
      const std::shared_ptr<prometheus::Collectable>& collectable) override
  {
    exposer_->RegisterCollectable(collectable);
  }

  void RemoveCollectable(
      const std::shared_ptr<prometheus::Collectable>& collectable) override
  {
    exposer_->RemoveCollectable(collectable);
  }

 private:
  std::unique_ptr<prometheus::Exposer> exposer_;
};

namespace {

const prometheus::Histogram::BucketBoundaries kJobDurationSecondsBuckets{
    1, 5, 15, 30, 60, 120, 300, 600, 1800, 3600};

#ifndef DOCPIPE_HAVE_NVML
auto
nvml_warning_flag() -> std::once_flag&
{
  static std::once_flag flag;
  return flag;
}
#endif

auto
metrics_atomic() -> std::atomic<std::shared_ptr<MetricsRegistry>>&
{
  static std::atomic<std::shared_ptr<MetricsRegistry>> instance{nullptr};
  return instance;
}

template <typename Fn>
void
with_metrics(Fn&& update)
{
  if (auto metrics = metrics_atomic().load(std::memory_order_acquire)) {
    std::forward<Fn>(update)(*metrics);
  }
}

}  // namespace

MetricsRegistry::MetricsRegistry(int port)
    : MetricsRegistry(port, query_all_gpu_memory, query_system_memory)
{
}

MetricsRegistry::MetricsRegistry(
    int port, GpuMemoryProvider gpu_provider,
    SystemMemoryProvider system_provider, bool start_sampler_thread,
    std::unique_ptr<ExposerHandle> exposer_handle)
    : registry(std::make_shared<prometheus::Registry>()),
      gpu_memory_provider_(std::move(gpu_provider)),
      system_memory_provider_(std::move(system_provider))
{
  if (!gpu_memory_provider_) {
    gpu_memory_provider_ = query_all_gpu_memory;
  }
  if (!system_memory_provider_) {
    system_memory_provider_ = query_system_memory;
  }
  initialize(port, start_sampler_thread, std::move(exposer_handle));
}

void
MetricsRegistry::initialize(
    int port, bool start_sampler_thread,
    std::unique_ptr<ExposerHandle> exposer_handle)
{
  try {
    if (!exposer_handle) {
      auto exposer = std::make_unique<prometheus::Exposer>(
          std::format("0.0.0.0:{}", port));
      exposer_handle =
          std::make_unique<PrometheusExposerHandle>(std::move(exposer));
    }
    exposer_handle->RegisterCollectable(registry);
    exposer_ = std::move(exposer_handle);
  }
  catch (const std::exception& e) {
    log_error(std::string("Failed to initialize metrics exposer: ") + e.what());
    throw;
  }

  const auto counter = [this](const char* name, const char* help) {
    return &prometheus::BuildCounter().Name(name).Help(help).Register(
                                           *registry)
                .Add({});
  };
  const auto gauge = [this](const char* name, const char* help) {
    return &prometheus::BuildGauge().Name(name).Help(help).Register(*registry)
                .Add({});
  };

  tasks_submitted_total =
      counter("tasks_submitted_total", "Jobs accepted into the queue");
  tasks_succeeded_total =
      counter("tasks_succeeded_total", "Jobs that finished successfully");
  tasks_failed_total = counter("tasks_failed_total", "Jobs that failed");
  rate_limited_total =
      counter("rate_limited_total", "Requests rejected by the rate limiter");

  job_queue_size = gauge("job_queue_size", "Jobs waiting in the queue");
  running_workers = gauge("running_workers", "Workers currently executing a job");
  inference_in_flight =
      gauge("inference_in_flight", "Engine acquisitions currently held");
  system_memory_available_bytes = gauge(
      "system_memory_available_bytes", "Available system memory in bytes");

  auto& duration_family = prometheus::BuildHistogram()
                              .Name("job_duration_seconds")
                              .Help("Wall time from job start to finish")
                              .Register(*registry);
  job_duration_seconds = &duration_family.Add({}, kJobDurationSecondsBuckets);

  gpu_memory_free_bytes_family = &prometheus::BuildGauge()
                                      .Name("gpu_memory_free_bytes")
                                      .Help("Free GPU memory in bytes per GPU")
                                      .Register(*registry);
  gpu_memory_total_bytes_family =
      &prometheus::BuildGauge()
           .Name("gpu_memory_total_bytes")
           .Help("Total GPU memory in bytes per GPU")
           .Register(*registry);

  if (start_sampler_thread) {
    sampler_thread_ = std::jthread(
        [this](const std::stop_token& stop) { this->sampling_loop(stop); });
  }
}

MetricsRegistry::~MetricsRegistry() noexcept
{
  request_stop();
  if (sampler_thread_.joinable()) {
    sampler_thread_.join();
  }
  if (exposer_ && registry) {
    try {
      exposer_->RemoveCollectable(registry);
    }
    catch (const std::exception& e) {
      log_error(
          std::string("Failed to remove metrics registry collectable: ") +
          e.what());
    }
  }
}

auto
init_metrics(int port) -> bool
{
  std::shared_ptr<MetricsRegistry> expected{nullptr};

  try {
    auto new_metrics = std::make_shared<MetricsRegistry>(port);

#ifndef DOCPIPE_HAVE_NVML
    std::call_once(nvml_warning_flag(), [] {
      log_warning(
          "NVML support is not available; GPU memory metrics are disabled.");
    });
#endif

    if (!metrics_atomic().compare_exchange_strong(
            expected, new_metrics, std::memory_order_acq_rel,
            std::memory_order_acquire)) {
      log_warning("Metrics were previously initialized");
      return false;
    }

    set_queue_size(0);
    set_running_workers(0);
    set_inference_in_flight(0);
    return true;
  }
  catch (const std::exception& e) {
    log_error(std::string("Metrics initialization failed: ") + e.what());
    return false;
  }
}

void
shutdown_metrics()
{
  metrics_atomic().store(nullptr, std::memory_order_release);
}

auto
get_metrics() -> std::shared_ptr<MetricsRegistry>
{
  return metrics_atomic().load(std::memory_order_acquire);
}

void
set_queue_size(std::size_t size)
{
  with_metrics([size](MetricsRegistry& metrics) {
    if (metrics.job_queue_size != nullptr) {
      metrics.job_queue_size->Set(static_cast<double>(size));
    }
  });
}

void
set_running_workers(std::size_t count)
{
  with_metrics([count](MetricsRegistry& metrics) {
    if (metrics.running_workers != nullptr) {
      metrics.running_workers->Set(static_cast<double>(count));
    }
  });
}

void
set_inference_in_flight(int count)
{
  with_metrics([count](MetricsRegistry& metrics) {
    if (metrics.inference_in_flight != nullptr) {
      metrics.inference_in_flight->Set(static_cast<double>(count));
    }
  });
}

void
increment_tasks_submitted()
{
  with_metrics([](MetricsRegistry& metrics) {
    if (metrics.tasks_submitted_total != nullptr) {
      metrics.tasks_submitted_total->Increment();
    }
  });
}

void
increment_tasks_succeeded()
{
  with_metrics([](MetricsRegistry& metrics) {
    if (metrics.tasks_succeeded_total != nullptr) {
      metrics.tasks_succeeded_total->Increment();
    }
  });
}

void
increment_tasks_failed()
{
  with_metrics([](MetricsRegistry& metrics) {
    if (metrics.tasks_failed_total != nullptr) {
      metrics.tasks_failed_total->Increment();
    }
  });
}

void
increment_rate_limited()
{
  with_metrics([](MetricsRegistry& metrics) {
    if (metrics.rate_limited_total != nullptr) {
      metrics.rate_limited_total->Increment();
    }
  });
}

void
observe_job_duration(double seconds)
{
  with_metrics([seconds](MetricsRegistry& metrics) {
    if (metrics.job_duration_seconds != nullptr) {
      metrics.job_duration_seconds->Observe(seconds);
    }
  });
}

void
MetricsRegistry::request_stop()
{
  if (sampler_thread_.joinable()) {
    sampler_thread_.request_stop();
  }
}

void
MetricsRegistry::run_sampling_request_nb()
{
  perform_sampling_request_nb();
}

void
MetricsRegistry::perform_sampling_request_nb()
{
  if (system_memory_available_bytes != nullptr && system_memory_provider_) {
    try {
      if (const auto reading = system_memory_provider_()) {
        system_memory_available_bytes->Set(reading->free_bytes);
      }
    }
    catch (const std::exception& e) {
      log_error(std::format("System memory sampling failed: {}", e.what()));
    }
  }

  if (!gpu_memory_provider_) {
    return;
  }

  try {
    for (const auto& sample : gpu_memory_provider_()) {
      const std::string label = std::to_string(sample.index);

      const auto ensure_gauge = [&](auto& gauges,
                                    auto* family) -> prometheus::Gauge* {
        auto [it, inserted] = gauges.try_emplace(sample.index, nullptr);
        if (inserted) {
          it->second = &family->Add({{"gpu", label}});
        }
        return it->second;
      };

      ensure_gauge(gpu_memory_free_gauges_, gpu_memory_free_bytes_family)
          ->Set(sample.memory.free_bytes);
      ensure_gauge(gpu_memory_total_gauges_, gpu_memory_total_bytes_family)
          ->Set(sample.memory.total_bytes);
    }
  }
  catch (const std::exception& e) {
    log_error(std::format("GPU metrics sampling failed: {}", e.what()));
  }
}

void
MetricsRegistry::sampling_loop(const std::stop_token& stop)
{
  using namespace std::chrono_literals;
  set_thread_log_tag("metrics-sampler");
  auto next_sleep = 1000ms;
  while (!stop.stop_requested()) {
    perform_sampling_request_nb();
    for (auto slept = 0ms; slept < next_sleep && !stop.stop_requested();
         slept += 50ms) {
      std::this_thread::sleep_for(50ms);
    }
  }
}

}  // namespace docpipe
