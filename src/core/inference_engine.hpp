#pragma once

#include <json/json.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "utils/runtime_config.hpp"

namespace docpipe {

enum class ComputeDevice : std::uint8_t { Unknown, Gpu, Cpu };

auto compute_device_name(ComputeDevice device) -> std::string_view;

struct PredictOptions {
  bool is_ocr = true;
  bool enable_formula = true;
  bool enable_table = true;
  std::string language = "ch";
  std::optional<std::string> page_ranges;
  std::optional<std::string> model_version;
};

// One converted page. `page_index` is the one-based page number within the
// whole document, also when the engine only processed a page range.
struct PageResult {
  int page_index = 1;
  Json::Value payload{Json::objectValue};
  std::string markdown;
  std::map<std::string, std::string> images;  // file name -> encoded bytes
};

// =============================================================================
// InferenceEngine: the document model behind a fixed interface
// =============================================================================
class InferenceEngine {
 public:
  InferenceEngine() = default;
  InferenceEngine(const InferenceEngine&) = delete;
  auto operator=(const InferenceEngine&) -> InferenceEngine& = delete;
  InferenceEngine(InferenceEngine&&) = delete;
  auto operator=(InferenceEngine&&) -> InferenceEngine& = delete;
  virtual ~InferenceEngine() = default;

  virtual auto predict(
      const std::filesystem::path& input,
      const PredictOptions& options) -> std::vector<PageResult> = 0;

  // Backends that can serve concurrent predict() calls on their own skip the
  // global inference lock and the memory gate.
  [[nodiscard]] virtual auto natively_concurrent() const -> bool
  {
    return false;
  }

  [[nodiscard]] virtual auto name() const -> std::string = 0;
};

struct EngineBuildContext {
  ComputeDevice device = ComputeDevice::Unknown;
  RuntimeConfig::EngineSettings settings{};
};

using EngineFactory = std::function<std::unique_ptr<InferenceEngine>(
    const EngineBuildContext&)>;

// =============================================================================
// EngineRegistry: backend name -> factory
// -----------------------------------------------------------------------------
// Factories report construction failures by throwing; create() passes those
// through unchanged and raises EngineLoadException for unknown names.
// =============================================================================
class EngineRegistry {
 public:
  void register_backend(std::string name, EngineFactory factory);
  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  [[nodiscard]] auto names() const -> std::vector<std::string>;
  [[nodiscard]] auto create(
      std::string_view name,
      const EngineBuildContext& context) const -> std::unique_ptr<InferenceEngine>;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, EngineFactory, std::less<>> factories_;
};

}  // namespace docpipe
