#pragma once

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/inference_engine.hpp"
#include "core/job.hpp"
#include "core/resource_manager.hpp"
#include "storage/job_storage.hpp"
#include "utils/runtime_config.hpp"

namespace docpipe {

// =============================================================================
// ArtifactWriter: persists engine output for one job
// -----------------------------------------------------------------------------
// layout.json is rewritten (temp file + rename) after every page so that it is
// always a complete {"pages": [...]} document. Images land in output/images
// under "page_<NNNN>_<basename>" and the page's markdown is rewritten to point
// at them. full.md is produced by finish().
// =============================================================================
class ArtifactWriter {
 public:
  explicit ArtifactWriter(JobPaths paths);

  void append(const PageResult& page);
  void finish();

  [[nodiscard]] auto page_count() const -> std::size_t
  {
    return markdown_parts_.size();
  }

  static auto sanitize_image_name(const std::string& key)
      -> std::optional<std::string>;
  static auto namespaced_image_name(int page_index, const std::string& base)
      -> std::string;

 private:
  JobPaths paths_;
  Json::Value layout_{Json::objectValue};
  std::vector<std::string> markdown_parts_;
};

// =============================================================================
// Pipeline: one job from input reference to persisted artifacts
// =============================================================================
class Pipeline {
 public:
  using PageCounter =
      std::function<std::optional<int>(const std::filesystem::path&)>;

  Pipeline(
      const RuntimeConfig& cfg, ResourceManager& resources,
      PageCounter page_counter = {});

  void run(
      const std::string& input_ref, bool is_url, const JobPaths& paths,
      const JobOptions& options);

  // Downloads remote inputs into paths.input_file; local inputs are returned
  // unchanged.
  auto materialize(
      const std::string& input_ref, bool is_url,
      const JobPaths& paths) const -> std::filesystem::path;

  // Checks the size and page limits. Returns the page count when known.
  auto validate(const std::filesystem::path& input) const -> std::optional<int>;

  // Page ranges to run, one engine acquisition each. A single std::nullopt
  // entry means "whole document".
  auto plan(
      const std::filesystem::path& input, std::optional<int> page_count,
      const JobOptions& options) const
      -> std::vector<std::optional<std::string>>;

 private:
  void run_batch(
      const std::filesystem::path& input,
      const std::optional<std::string>& range, const JobOptions& options,
      ArtifactWriter& writer);

  RuntimeConfig::LimitSettings limits_;
  std::uintmax_t max_upload_bytes_;
  RuntimeConfig::BatchingSettings batching_;
  std::chrono::milliseconds acquire_timeout_;
  VerbosityLevel verbosity_;
  ResourceManager& resources_;
  PageCounter page_counter_;
};

auto to_predict_options(
    const JobOptions& options, const std::optional<std::string>& range)
    -> PredictOptions;

}  // namespace docpipe
