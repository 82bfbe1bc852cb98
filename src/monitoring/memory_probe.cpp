#include "monitoring/memory_probe.hpp"

#include <malloc.h>

#include <format>
#include <fstream>
#include <istream>
#include <mutex>
#include <string>

#ifdef DOCPIPE_HAVE_NVML
#include <nvml.h>
#endif

#include "utils/logger.hpp"

namespace docpipe {

namespace monitoring::detail {

auto
read_meminfo(std::istream& input, MemInfo& out) -> bool
{
  bool have_total = false;
  bool have_available = false;
  std::string key;
  unsigned long long value = 0;
  std::string unit;
  while (input >> key >> value) {
    std::getline(input, unit);
    if (key == "MemTotal:") {
      out.total_kib = value;
      have_total = true;
    } else if (key == "MemAvailable:") {
      out.available_kib = value;
      have_available = true;
    }
    if (have_total && have_available) {
      return true;
    }
  }
  return false;
}

auto
read_meminfo(const std::filesystem::path& path, MemInfo& out) -> bool
{
  std::ifstream input{path};
  if (!input.is_open()) {
    return false;
  }
  return read_meminfo(input, out);
}

}  // namespace monitoring::detail

namespace {

constexpr double kBytesPerKiB = 1024.0;

#ifdef DOCPIPE_HAVE_NVML

class NvmlWrapper {
 public:
  static auto instance() -> NvmlWrapper&
  {
    static NvmlWrapper wrapper;
    return wrapper;
  }

  auto device_count() -> unsigned int
  {
    const std::scoped_lock guard(mutex_);
    if (!initialized_) {
      return 0;
    }
    unsigned int count = 0;
    const nvmlReturn_t status = nvmlDeviceGetCount(&count);
    if (status != NVML_SUCCESS) {
      log_warning(
          std::string("nvmlDeviceGetCount failed: ") + error_string(status));
      return 0;
    }
    return count;
  }

  auto query_memory(unsigned int index) -> std::optional<MemoryReading>
  {
    const std::scoped_lock guard(mutex_);
    if (!initialized_) {
      return std::nullopt;
    }
    nvmlDevice_t device{};
    nvmlReturn_t status = nvmlDeviceGetHandleByIndex(index, &device);
    if (status != NVML_SUCCESS) {
      log_warning(std::format(
          "nvmlDeviceGetHandleByIndex failed for GPU {}: {}", index,
          error_string(status)));
      return std::nullopt;
    }
    nvmlMemory_t memory_info{};
    status = nvmlDeviceGetMemoryInfo(device, &memory_info);
    if (status != NVML_SUCCESS) {
      log_warning(std::format(
          "nvmlDeviceGetMemoryInfo failed for GPU {}: {}", index,
          error_string(status)));
      return std::nullopt;
    }
    return MemoryReading{
        static_cast<double>(memory_info.free),
        static_cast<double>(memory_info.total)};
  }

  NvmlWrapper(const NvmlWrapper&) = delete;
  auto operator=(const NvmlWrapper&) -> NvmlWrapper& = delete;
  NvmlWrapper(NvmlWrapper&&) = delete;
  auto operator=(NvmlWrapper&&) -> NvmlWrapper& = delete;

 private:
  NvmlWrapper()
  {
    const nvmlReturn_t status = nvmlInit();
    if (status != NVML_SUCCESS) {
      log_warning(
          std::string("Failed to initialize NVML: ") + error_string(status));
      return;
    }
    initialized_ = true;
  }

  ~NvmlWrapper()
  {
    if (initialized_) {
      nvmlShutdown();
    }
  }

  static auto error_string(nvmlReturn_t status) -> const char*
  {
    const char* err = nvmlErrorString(status);
    return err != nullptr ? err : "unknown error";
  }

  bool initialized_{false};
  std::mutex mutex_;
};

#endif  // DOCPIPE_HAVE_NVML

}  // namespace

auto
query_system_memory() -> std::optional<MemoryReading>
{
  static const std::filesystem::path kProcMeminfo{"/proc/meminfo"};
  monitoring::detail::MemInfo info{};
  if (!monitoring::detail::read_meminfo(kProcMeminfo, info)) {
    return std::nullopt;
  }
  return MemoryReading{
      static_cast<double>(info.available_kib) * kBytesPerKiB,
      static_cast<double>(info.total_kib) * kBytesPerKiB};
}

#ifdef DOCPIPE_HAVE_NVML

auto
query_gpu_memory(int gpu_index) -> std::optional<MemoryReading>
{
  if (gpu_index < 0) {
    return std::nullopt;
  }
  return NvmlWrapper::instance().query_memory(
      static_cast<unsigned int>(gpu_index));
}

auto
query_all_gpu_memory() -> std::vector<GpuMemorySample>
{
  auto& nvml = NvmlWrapper::instance();
  const unsigned int count = nvml.device_count();
  std::vector<GpuMemorySample> samples;
  samples.reserve(count);
  for (unsigned int idx = 0; idx < count; ++idx) {
    if (auto reading = nvml.query_memory(idx)) {
      samples.push_back(GpuMemorySample{static_cast<int>(idx), *reading});
    }
  }
  return samples;
}

auto
gpu_available() -> bool
{
  return NvmlWrapper::instance().device_count() > 0;
}

#else

auto
query_gpu_memory(int /*gpu_index*/) -> std::optional<MemoryReading>
{
  return std::nullopt;
}

auto
query_all_gpu_memory() -> std::vector<GpuMemorySample>
{
  return {};
}

auto
gpu_available() -> bool
{
  return false;
}

#endif  // DOCPIPE_HAVE_NVML

void
reclaim_process_memory()
{
  malloc_trim(0);
}

}  // namespace docpipe
