#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <prometheus/metric_family.h>

#include "monitoring/metrics.hpp"
#include "test_helpers.hpp"

using namespace docpipe;

namespace {

class RecordingExposer : public MetricsRegistry::ExposerHandle {
 public:
  explicit RecordingExposer(int* registered) : registered_(registered) {}

  void RegisterCollectable(
      const std::shared_ptr<prometheus::Collectable>& /*collectable*/) override
  {
    ++*registered_;
  }
  void RemoveCollectable(
      const std::shared_ptr<prometheus::Collectable>& /*collectable*/) override
  {
    --*registered_;
  }

 private:
  int* registered_;
};

auto
find_family(
    const std::vector<prometheus::MetricFamily>& families,
    std::string_view name) -> const prometheus::MetricFamily*
{
  const auto it = std::ranges::find_if(
      families, [name](const auto& family) { return family.name == name; });
  return it == families.end() ? nullptr : &*it;
}

auto
gauge_for_gpu(const prometheus::MetricFamily& family, std::string_view gpu)
    -> std::optional<double>
{
  for (const auto& metric : family.metric) {
    for (const auto& label : metric.label) {
      if (label.name == "gpu" && label.value == gpu) {
        return metric.gauge.value;
      }
    }
  }
  return std::nullopt;
}

auto
make_offline_registry(
    MetricsRegistry::GpuMemoryProvider gpu,
    MetricsRegistry::SystemMemoryProvider system, int* registered)
    -> std::unique_ptr<MetricsRegistry>
{
  return std::make_unique<MetricsRegistry>(
      0, std::move(gpu), std::move(system), false,
      std::make_unique<RecordingExposer>(registered));
}

}  // namespace

TEST(Metrics, InitializesPointersAndRegistry)
{
  ASSERT_TRUE(init_metrics(0));

  const auto metrics = get_metrics();
  ASSERT_NE(metrics, nullptr);
  ASSERT_NE(metrics->tasks_submitted_total, nullptr);
  ASSERT_NE(metrics->job_queue_size, nullptr);
  ASSERT_NE(metrics->job_duration_seconds, nullptr);

  const auto families = metrics->registry->Collect();
  for (const auto* name :
       {"tasks_submitted_total", "tasks_succeeded_total", "tasks_failed_total",
        "rate_limited_total", "job_queue_size", "running_workers",
        "inference_in_flight", "job_duration_seconds",
        "system_memory_available_bytes", "gpu_memory_free_bytes",
        "gpu_memory_total_bytes"}) {
    EXPECT_NE(find_family(families, name), nullptr) << name;
  }

  shutdown_metrics();
  EXPECT_EQ(get_metrics(), nullptr);
}

TEST(Metrics, RepeatedInitKeepsFirstRegistry)
{
  ASSERT_TRUE(init_metrics(0));
  const auto first = get_metrics();
  {
    CaptureStream capture{std::cerr};
    EXPECT_FALSE(init_metrics(0));
  }
  EXPECT_EQ(get_metrics(), first);
  shutdown_metrics();
}

TEST(Metrics, InitFailsWhenPortIsTaken)
{
  shutdown_metrics();
  const int reserved_socket = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(reserved_socket, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = 0;
  ASSERT_EQ(
      ::bind(reserved_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)),
      0);
  ASSERT_EQ(::listen(reserved_socket, 1), 0);
  socklen_t len = sizeof(addr);
  ASSERT_EQ(
      ::getsockname(reserved_socket, reinterpret_cast<sockaddr*>(&addr), &len),
      0);

  {
    CaptureStream capture{std::cerr};
    EXPECT_FALSE(init_metrics(ntohs(addr.sin_port)));
  }
  EXPECT_EQ(get_metrics(), nullptr);
  ::close(reserved_socket);
}

TEST(Metrics, HelpersAreNoopsWithoutRegistry)
{
  shutdown_metrics();
  set_queue_size(3);
  set_running_workers(1);
  set_inference_in_flight(1);
  increment_tasks_submitted();
  increment_tasks_succeeded();
  increment_tasks_failed();
  increment_rate_limited();
  observe_job_duration(1.5);
  EXPECT_EQ(get_metrics(), nullptr);
}

TEST(Metrics, HelpersUpdateRegistry)
{
  ASSERT_TRUE(init_metrics(0));
  const auto metrics = get_metrics();

  set_queue_size(4);
  set_running_workers(2);
  set_inference_in_flight(1);
  increment_tasks_submitted();
  increment_tasks_submitted();
  increment_tasks_succeeded();
  increment_tasks_failed();
  increment_rate_limited();
  observe_job_duration(12.0);

  EXPECT_DOUBLE_EQ(metrics->job_queue_size->Value(), 4.0);
  EXPECT_DOUBLE_EQ(metrics->running_workers->Value(), 2.0);
  EXPECT_DOUBLE_EQ(metrics->inference_in_flight->Value(), 1.0);
  EXPECT_DOUBLE_EQ(metrics->tasks_submitted_total->Value(), 2.0);
  EXPECT_DOUBLE_EQ(metrics->tasks_succeeded_total->Value(), 1.0);
  EXPECT_DOUBLE_EQ(metrics->tasks_failed_total->Value(), 1.0);
  EXPECT_DOUBLE_EQ(metrics->rate_limited_total->Value(), 1.0);
  const auto histogram = metrics->job_duration_seconds->Collect().histogram;
  EXPECT_EQ(histogram.sample_count, 1U);
  EXPECT_DOUBLE_EQ(histogram.sample_sum, 12.0);

  shutdown_metrics();
}

TEST(MetricsSampling, RecordsSystemAndGpuMemory)
{
  int registered = 0;
  auto metrics = make_offline_registry(
      [] {
        return std::vector<GpuMemorySample>{
            {0, MemoryReading{1000.0, 4000.0}},
            {1, MemoryReading{2000.0, 8000.0}}};
      },
      []() -> std::optional<MemoryReading> {
        return MemoryReading{512.0, 1024.0};
      },
      &registered);
  EXPECT_EQ(registered, 1);

  metrics->run_sampling_request_nb();

  EXPECT_DOUBLE_EQ(metrics->system_memory_available_bytes->Value(), 512.0);
  const auto families = metrics->registry->Collect();
  const auto* free_family = find_family(families, "gpu_memory_free_bytes");
  const auto* total_family = find_family(families, "gpu_memory_total_bytes");
  ASSERT_NE(free_family, nullptr);
  ASSERT_NE(total_family, nullptr);
  EXPECT_EQ(gauge_for_gpu(*free_family, "0"), 1000.0);
  EXPECT_EQ(gauge_for_gpu(*free_family, "1"), 2000.0);
  EXPECT_EQ(gauge_for_gpu(*total_family, "1"), 8000.0);

  metrics.reset();
  EXPECT_EQ(registered, 0);
}

TEST(MetricsSampling, RepeatedSamplesReuseGauges)
{
  int registered = 0;
  double free_bytes = 100.0;
  auto metrics = make_offline_registry(
      [&free_bytes] {
        return std::vector<GpuMemorySample>{
            {0, MemoryReading{free_bytes, 400.0}}};
      },
      []() -> std::optional<MemoryReading> { return std::nullopt; },
      &registered);

  metrics->run_sampling_request_nb();
  free_bytes = 50.0;
  metrics->run_sampling_request_nb();

  const auto families = metrics->registry->Collect();
  const auto* family = find_family(families, "gpu_memory_free_bytes");
  ASSERT_NE(family, nullptr);
  EXPECT_EQ(family->metric.size(), 1U);
  EXPECT_EQ(gauge_for_gpu(*family, "0"), 50.0);
  EXPECT_DOUBLE_EQ(metrics->system_memory_available_bytes->Value(), 0.0);
}

TEST(MetricsSampling, ProviderFailuresAreLogged)
{
  int registered = 0;
  auto metrics = make_offline_registry(
      []() -> std::vector<GpuMemorySample> {
        throw std::runtime_error("nvml gone");
      },
      []() -> std::optional<MemoryReading> {
        throw std::runtime_error("meminfo gone");
      },
      &registered);

  CaptureStream capture{std::cerr};
  metrics->run_sampling_request_nb();
  EXPECT_NE(capture.str().find("nvml gone"), std::string::npos);
  EXPECT_NE(capture.str().find("meminfo gone"), std::string::npos);
}
