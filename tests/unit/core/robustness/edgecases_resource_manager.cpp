#include <gtest/gtest.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "core/resource_manager.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace docpipe;
using namespace std::chrono_literals;

TEST(ResourceManagerEdgeCases, BothBackendsFailing)
{
  TempDir dir;
  FakeRegistry fake;
  fake.registry->register_backend(
      "broken", [](const EngineBuildContext&) -> std::unique_ptr<InferenceEngine> {
        throw std::runtime_error("no weights");
      });
  auto cfg = make_test_config(dir.path());
  cfg.engine.backend = "broken";
  cfg.engine.fallback_backend = "missing";
  CaptureStream capture{std::cerr};
  ResourceManager manager(cfg, fake.registry, cpu_providers(), false);

  EXPECT_THROW(static_cast<void>(manager.acquire(1s)), EngineLoadException);
  const auto status = manager.status();
  EXPECT_FALSE(status.loaded);
  EXPECT_EQ(status.device, ComputeDevice::Unknown);
  ASSERT_TRUE(status.fallback_reason.has_value());
  EXPECT_TRUE(status.fallback_reason->starts_with("load failed:"));

  // The lock is free again: a working backend can still be used elsewhere.
  EXPECT_EQ(manager.in_flight(), 0);
}

TEST(ResourceManagerEdgeCases, UnknownBackendWithoutFallback)
{
  TempDir dir;
  FakeRegistry fake;
  auto cfg = make_test_config(dir.path());
  cfg.engine.backend = "nope";
  CaptureStream capture{std::cerr};
  ResourceManager manager(cfg, fake.registry, cpu_providers(), false);
  EXPECT_THROW(static_cast<void>(manager.acquire(1s)), EngineLoadException);
  EXPECT_THROW(static_cast<void>(manager.acquire(1s)), EngineLoadException);
}

TEST(ResourceManagerEdgeCases, DisabledEngineRefusesToLoad)
{
  TempDir dir;
  FakeRegistry fake;
  auto cfg = make_test_config(dir.path());
  cfg.engine.enabled = false;
  ResourceManager manager(cfg, fake.registry, cpu_providers(), false);
  EXPECT_THROW(static_cast<void>(manager.acquire(1s)), EngineLoadException);
  EXPECT_EQ(fake.builds->load(), 0);
}

TEST(ResourceManagerEdgeCases, MissingGpuReadingAllowsOne)
{
  TempDir dir;
  FakeRegistry fake;
  auto cfg = make_test_config(dir.path());
  cfg.scheduling.force_cpu = false;
  cfg.scheduling.max_workers = 8;
  auto providers = cpu_providers();
  providers.gpu_available = [] { return true; };
  ResourceManager manager(cfg, fake.registry, providers, false);
  static_cast<void>(manager.acquire(1s));
  EXPECT_EQ(manager.status().device, ComputeDevice::Gpu);
  EXPECT_EQ(manager.allowed_concurrency(), 1);
}

TEST(ResourceManagerEdgeCases, MissingSystemReadingIsNoPressure)
{
  TempDir dir;
  FakeRegistry fake;
  auto providers = cpu_providers();
  providers.system_memory = []() -> std::optional<MemoryReading> {
    return std::nullopt;
  };
  ResourceManager manager(
      make_test_config(dir.path()), fake.registry, providers, false);
  EXPECT_FALSE(manager.memory_pressure());
}

TEST(ResourceManagerEdgeCases, MovedLeaseReleasesOnce)
{
  TempDir dir;
  FakeRegistry fake;
  ResourceManager manager(
      make_test_config(dir.path()), fake.registry, cpu_providers(), false);
  auto lease = manager.acquire(1s);
  InferenceLease moved = std::move(lease);
  EXPECT_FALSE(lease.valid());  // NOLINT(bugprone-use-after-move)
  EXPECT_THROW(static_cast<void>(lease.engine()), std::logic_error);
  moved.release();
  moved.release();
  EXPECT_EQ(manager.in_flight(), 0);
  EXPECT_NO_THROW(static_cast<void>(manager.acquire(50ms)));
}

TEST(ResourceManagerEdgeCases, NullRegistryThrows)
{
  TempDir dir;
  EXPECT_THROW(
      ResourceManager(make_test_config(dir.path()), nullptr, cpu_providers(),
                      false),
      std::invalid_argument);
}
