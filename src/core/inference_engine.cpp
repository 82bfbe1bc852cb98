#include "inference_engine.hpp"

#include <format>
#include <stdexcept>
#include <utility>

#include "utils/exceptions.hpp"

namespace docpipe {

auto
compute_device_name(ComputeDevice device) -> std::string_view
{
  switch (device) {
    case ComputeDevice::Gpu:
      return "gpu";
    case ComputeDevice::Cpu:
      return "cpu";
    case ComputeDevice::Unknown:
      break;
  }
  return "unknown";
}

void
EngineRegistry::register_backend(std::string name, EngineFactory factory)
{
  if (name.empty() || !factory) {
    throw std::invalid_argument("Engine backend needs a name and a factory");
  }
  const std::scoped_lock lock(mutex_);
  factories_.insert_or_assign(std::move(name), std::move(factory));
}

auto
EngineRegistry::contains(std::string_view name) const -> bool
{
  const std::scoped_lock lock(mutex_);
  return factories_.contains(name);
}

auto
EngineRegistry::names() const -> std::vector<std::string>
{
  const std::scoped_lock lock(mutex_);
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& [name, factory] : factories_) {
    out.push_back(name);
  }
  return out;
}

auto
EngineRegistry::create(
    std::string_view name,
    const EngineBuildContext& context) const -> std::unique_ptr<InferenceEngine>
{
  EngineFactory factory;
  {
    const std::scoped_lock lock(mutex_);
    const auto it = factories_.find(name);
    if (it == factories_.end()) {
      throw EngineLoadException(
          std::format("Unknown engine backend '{}'", name));
    }
    factory = it->second;
  }
  auto engine = factory(context);
  if (!engine) {
    throw EngineLoadException(
        std::format("Engine backend '{}' returned no engine", name));
  }
  return engine;
}

}  // namespace docpipe
