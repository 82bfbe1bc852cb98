#pragma once

#include <json/json.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/inference_engine.hpp"
#include "utils/runtime_config.hpp"

namespace docpipe {

inline constexpr std::string_view kHttpBackendName = "http";

// =============================================================================
// HttpEngine: remote inference server reached over HTTP
// -----------------------------------------------------------------------------
// POST <endpoint>/predict with
//   {"document": <base64>, "filename", "is_ocr", "enable_formula",
//    "enable_table", "language", "page_ranges", "model_version"}
// answered by
//   {"pages": [{"page_index", "res", "markdown", "images": {name: <base64>}}]}
// The server owns its own scheduling, so calls are made concurrently.
// =============================================================================
class HttpEngine : public InferenceEngine {
 public:
  HttpEngine(RuntimeConfig::EngineSettings settings, ComputeDevice device);

  auto predict(
      const std::filesystem::path& input,
      const PredictOptions& options) -> std::vector<PageResult> override;

  [[nodiscard]] auto natively_concurrent() const -> bool override
  {
    return true;
  }
  [[nodiscard]] auto name() const -> std::string override
  {
    return std::string(kHttpBackendName);
  }

  // GET <endpoint>/health; throws EngineLoadException when unreachable.
  void probe() const;

 private:
  auto post_json(const std::string& url, const std::string& body) const
      -> std::string;

  RuntimeConfig::EngineSettings settings_;
  ComputeDevice device_;
  std::string base_url_;
};

auto build_predict_request(
    const std::string& document_bytes, const std::string& filename,
    const PredictOptions& options, ComputeDevice device) -> Json::Value;

// Throws EngineExecutionException on a malformed answer.
auto parse_predict_response(
    const std::string& body, const PredictOptions& options)
    -> std::vector<PageResult>;

// Adds the built-in backends ("http") to `registry`.
void register_builtin_backends(EngineRegistry& registry);

}  // namespace docpipe
