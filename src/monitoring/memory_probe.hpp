#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <vector>

namespace docpipe {

// Free and total bytes of one memory pool (a GPU or system RAM). For system
// memory `free_bytes` is MemAvailable.
struct MemoryReading {
  double free_bytes = 0.0;
  double total_bytes = 0.0;
};

struct GpuMemorySample {
  int index = 0;
  MemoryReading memory{};
};

// System memory from /proc/meminfo.
auto query_system_memory() -> std::optional<MemoryReading>;

// GPU memory through NVML; std::nullopt when built without NVML, when NVML
// fails to initialise or when the index does not exist.
auto query_gpu_memory(int gpu_index) -> std::optional<MemoryReading>;
auto query_all_gpu_memory() -> std::vector<GpuMemorySample>;
auto gpu_available() -> bool;

// Returns freed heap pages to the OS (malloc_trim on glibc).
void reclaim_process_memory();

}  // namespace docpipe

namespace docpipe::monitoring::detail {

struct MemInfo {
  unsigned long long total_kib{0};
  unsigned long long available_kib{0};
};

auto read_meminfo(std::istream& input, MemInfo& out) -> bool;
auto read_meminfo(const std::filesystem::path& path, MemInfo& out) -> bool;

}  // namespace docpipe::monitoring::detail
