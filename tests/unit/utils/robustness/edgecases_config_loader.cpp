#include <gtest/gtest.h>

#include <iostream>
#include <string>

#include "test_helpers.hpp"
#include "utils/config_loader.hpp"

using namespace docpipe;

namespace {
auto
load_quietly(const std::string& yaml) -> RuntimeConfig
{
  CaptureStream capture{std::cerr};
  return load_config_from_string(yaml);
}
}  // namespace

TEST(ConfigLoaderEdgeCases, UnknownTopLevelKeyIsInvalid)
{
  CaptureStream capture{std::cerr};
  const auto cfg = load_config_from_string("workers: 3\n");
  EXPECT_FALSE(cfg.valid);
  EXPECT_NE(capture.str().find("Unknown configuration option: workers"),
            std::string::npos);
}

TEST(ConfigLoaderEdgeCases, UnknownNestedKeyNamesItsSection)
{
  CaptureStream capture{std::cerr};
  const auto cfg = load_config_from_string("scheduling:\n  max_worker: 3\n");
  EXPECT_FALSE(cfg.valid);
  EXPECT_NE(capture.str().find("scheduling.max_worker"), std::string::npos);
}

TEST(ConfigLoaderEdgeCases, RejectsNonPositiveValues)
{
  EXPECT_FALSE(load_quietly("scheduling:\n  max_workers: 0\n").valid);
  EXPECT_FALSE(load_quietly("scheduling:\n  max_queue_size: -1\n").valid);
  EXPECT_FALSE(load_quietly("limits:\n  max_pages: 0\n").valid);
  EXPECT_FALSE(load_quietly("scheduling:\n  mem_per_job_gb: 0\n").valid);
  EXPECT_FALSE(load_quietly("rate_limit:\n  rate_per_second: 0\n").valid);
  EXPECT_FALSE(load_quietly("scheduling:\n  reserve_gpu_mem_gb: -2\n").valid);
}

TEST(ConfigLoaderEdgeCases, PollBoundsMustBeOrdered)
{
  EXPECT_FALSE(load_quietly(
                   "scheduling:\n  poll_interval_ms: 100\n"
                   "  max_poll_interval_ms: 50\n")
                   .valid);
}

TEST(ConfigLoaderEdgeCases, SectionMustBeMapping)
{
  EXPECT_FALSE(load_quietly("storage: data\n").valid);
}

TEST(ConfigLoaderEdgeCases, MalformedYamlIsInvalid)
{
  EXPECT_FALSE(load_quietly("scheduling: [unterminated\n").valid);
  EXPECT_FALSE(load_quietly("- just\n- a list\n").valid);
}

TEST(ConfigLoaderEdgeCases, TypeMismatchIsInvalid)
{
  EXPECT_FALSE(load_quietly("scheduling:\n  max_workers: many\n").valid);
  EXPECT_FALSE(load_quietly("batching:\n  enable_auto_batch: sometimes\n").valid);
}

TEST(ConfigLoaderEdgeCases, MissingFileIsInvalid)
{
  CaptureStream capture{std::cerr};
  const auto cfg = load_config("/nonexistent/docpipe.yaml");
  EXPECT_FALSE(cfg.valid);
  EXPECT_EQ(cfg.config_path, "/nonexistent/docpipe.yaml");
}

TEST(ConfigLoaderEdgeCases, UnknownPublishBackendIsInvalid)
{
  EXPECT_FALSE(load_quietly("publish:\n  backend: ftp\n").valid);
}

TEST(ConfigLoaderEdgeCases, MissingModelPathIsInvalid)
{
  EXPECT_FALSE(
      load_quietly("engine:\n  model_path: /nonexistent/model.bin\n").valid);
}

TEST(ConfigLoaderEdgeCases, MetricsPortOutOfRange)
{
  EXPECT_FALSE(load_quietly("metrics_port: 70000\n").valid);
}

TEST(ConfigLoaderEdgeCases, BadVerbosityIsInvalid)
{
  EXPECT_FALSE(load_quietly("verbosity: chatty\n").valid);
}
