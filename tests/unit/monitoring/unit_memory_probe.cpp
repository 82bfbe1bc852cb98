#include <gtest/gtest.h>

#include <sstream>

#include "monitoring/memory_probe.hpp"
#include "test_helpers.hpp"

using namespace docpipe;
using docpipe::monitoring::detail::MemInfo;
using docpipe::monitoring::detail::read_meminfo;

TEST(MemoryProbe, ReadsTotalAndAvailable)
{
  std::istringstream input(
      "MemTotal:       16318480 kB\n"
      "MemFree:          431212 kB\n"
      "MemAvailable:    9123456 kB\n"
      "Buffers:          123456 kB\n");
  MemInfo info;
  ASSERT_TRUE(read_meminfo(input, info));
  EXPECT_EQ(info.total_kib, 16318480ULL);
  EXPECT_EQ(info.available_kib, 9123456ULL);
}

TEST(MemoryProbe, MissingAvailableLineFails)
{
  std::istringstream input("MemTotal: 1024 kB\nMemFree: 512 kB\n");
  MemInfo info;
  EXPECT_FALSE(read_meminfo(input, info));
}

TEST(MemoryProbe, ReadsFromFile)
{
  TempDir dir;
  const auto path = dir.path() / "meminfo";
  write_file(path, "MemAvailable: 2048 kB\nMemTotal: 4096 kB\n");
  MemInfo info;
  ASSERT_TRUE(read_meminfo(path, info));
  EXPECT_EQ(info.total_kib, 4096ULL);
  EXPECT_EQ(info.available_kib, 2048ULL);
}

TEST(MemoryProbe, MissingFileFails)
{
  TempDir dir;
  MemInfo info;
  EXPECT_FALSE(read_meminfo(dir.path() / "absent", info));
}

TEST(MemoryProbe, SystemMemoryOnLinux)
{
  const auto reading = query_system_memory();
  ASSERT_TRUE(reading.has_value());
  EXPECT_GT(reading->total_bytes, 0.0);
  EXPECT_LE(reading->free_bytes, reading->total_bytes);
}

TEST(MemoryProbe, MissingGpuIndexHasNoReading)
{
  EXPECT_FALSE(query_gpu_memory(4096).has_value());
}
