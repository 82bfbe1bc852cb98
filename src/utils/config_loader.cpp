#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <filesystem>
#include <format>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "logger.hpp"
#include "transparent_hash.hpp"

namespace docpipe {

namespace {

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

using KeySet = std::unordered_set<std::string, TransparentHash, std::equal_to<>>;

auto
post_parse_hook_mutex() -> std::mutex&
{
  static std::mutex mutex;
  return mutex;
}

auto
post_parse_hook() -> ConfigLoaderPostParseHook&
{
  static ConfigLoaderPostParseHook hook;
  return hook;
}

auto
validate_keys(
    const YAML::Node& node, const KeySet& allowed, std::string_view section,
    RuntimeConfig& cfg) -> bool
{
  for (const auto& kvalue : node) {
    if (!kvalue.first.IsScalar()) {
      log_error("Configuration keys must be scalar strings");
      cfg.valid = false;
      continue;
    }
    const auto key = kvalue.first.as<std::string>();
    if (!allowed.contains(key)) {
      if (section.empty()) {
        log_error(std::format("Unknown configuration option: {}", key));
      } else {
        log_error(std::format("Unknown configuration option: {}.{}", section, key));
      }
      cfg.valid = false;
    }
  }
  return cfg.valid;
}

auto
section_node(const YAML::Node& root, const char* name, RuntimeConfig& cfg)
    -> YAML::Node
{
  YAML::Node node = root[name];
  if (node && !node.IsMap()) {
    log_error(std::format("Configuration section '{}' must be a mapping", name));
    cfg.valid = false;
    return YAML::Node{};
  }
  return node;
}

void
read_positive_int(const YAML::Node& node, const char* key, int& out)
{
  if (node[key]) {
    const int value = node[key].as<int>();
    if (value <= 0) {
      throw std::invalid_argument(std::format("{} must be > 0", key));
    }
    out = value;
  }
}

void
read_non_negative_int(const YAML::Node& node, const char* key, int& out)
{
  if (node[key]) {
    const int value = node[key].as<int>();
    if (value < 0) {
      throw std::invalid_argument(std::format("{} must be >= 0", key));
    }
    out = value;
  }
}

void
read_non_negative_double(const YAML::Node& node, const char* key, double& out)
{
  if (node[key]) {
    const double value = node[key].as<double>();
    if (!std::isfinite(value) || value < 0.0) {
      throw std::invalid_argument(std::format("{} must be >= 0", key));
    }
    out = value;
  }
}

void
read_bool(const YAML::Node& node, const char* key, bool& out)
{
  if (node[key]) {
    out = node[key].as<bool>();
  }
}

void
read_string(const YAML::Node& node, const char* key, std::string& out)
{
  if (node[key]) {
    out = node[key].as<std::string>();
  }
}

void
parse_top_level(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["verbosity"]) {
    cfg.verbosity = parse_verbosity_level(root["verbosity"].as<std::string>());
  } else if (root["verbose"]) {
    cfg.verbosity = parse_verbosity_level(root["verbose"].as<std::string>());
  }
  if (root["metrics_port"]) {
    cfg.metrics_port = root["metrics_port"].as<int>();
    if (cfg.metrics_port < kMinPort || cfg.metrics_port > kMaxPort) {
      log_error("metrics_port must be between 1 and 65535");
      cfg.valid = false;
    }
  }
  read_bool(root, "metrics_enabled", cfg.metrics_enabled);
}

void
parse_storage(const YAML::Node& root, RuntimeConfig& cfg)
{
  const auto node = section_node(root, "storage", cfg);
  if (!node) {
    return;
  }
  static const KeySet kKeys{
      "root", "max_job_retention", "retention_sweep_seconds",
      "inbox_scan_interval_ms"};
  if (!validate_keys(node, kKeys, "storage", cfg)) {
    return;
  }
  read_string(node, "root", cfg.storage.root);
  if (cfg.storage.root.empty()) {
    log_error("storage.root must not be empty");
    cfg.valid = false;
  }
  if (node["max_job_retention"]) {
    const auto tmp = node["max_job_retention"].as<long long>();
    if (tmp <= 0) {
      throw std::invalid_argument("max_job_retention must be > 0");
    }
    cfg.storage.max_job_retention = static_cast<std::size_t>(tmp);
  }
  read_positive_int(
      node, "retention_sweep_seconds", cfg.storage.retention_sweep_seconds);
  read_positive_int(
      node, "inbox_scan_interval_ms", cfg.storage.inbox_scan_interval_ms);
}

void
parse_scheduling(const YAML::Node& root, RuntimeConfig& cfg)
{
  const auto node = section_node(root, "scheduling", cfg);
  if (!node) {
    return;
  }
  static const KeySet kKeys{
      "max_workers",         "max_queue_size",       "dynamic_workers",
      "mem_per_job_gb",      "reserve_gpu_mem_gb",   "min_system_memory_gb",
      "gpu_index",           "force_cpu",            "idle_unload_seconds",
      "idle_check_interval_ms", "acquire_timeout_seconds", "poll_interval_ms",
      "max_poll_interval_ms", "worker_poll_ms",      "stop_timeout_ms"};
  if (!validate_keys(node, kKeys, "scheduling", cfg)) {
    return;
  }
  auto& sched = cfg.scheduling;
  read_positive_int(node, "max_workers", sched.max_workers);
  if (node["max_queue_size"]) {
    const auto tmp = node["max_queue_size"].as<long long>();
    if (tmp <= 0) {
      throw std::invalid_argument("max_queue_size must be > 0");
    }
    sched.max_queue_size = static_cast<std::size_t>(tmp);
  }
  read_bool(node, "dynamic_workers", sched.dynamic_workers);
  read_non_negative_double(node, "mem_per_job_gb", sched.mem_per_job_gb);
  read_non_negative_double(node, "reserve_gpu_mem_gb", sched.reserve_gpu_mem_gb);
  read_non_negative_double(
      node, "min_system_memory_gb", sched.min_system_memory_gb);
  read_non_negative_int(node, "gpu_index", sched.gpu_index);
  read_bool(node, "force_cpu", sched.force_cpu);
  read_non_negative_int(node, "idle_unload_seconds", sched.idle_unload_seconds);
  read_positive_int(node, "idle_check_interval_ms", sched.idle_check_interval_ms);
  read_non_negative_int(
      node, "acquire_timeout_seconds", sched.acquire_timeout_seconds);
  read_positive_int(node, "poll_interval_ms", sched.poll_interval_ms);
  read_positive_int(node, "max_poll_interval_ms", sched.max_poll_interval_ms);
  read_positive_int(node, "worker_poll_ms", sched.worker_poll_ms);
  read_positive_int(node, "stop_timeout_ms", sched.stop_timeout_ms);

  if (sched.max_poll_interval_ms < sched.poll_interval_ms) {
    log_error("max_poll_interval_ms must be >= poll_interval_ms");
    cfg.valid = false;
  }
  if (sched.mem_per_job_gb <= 0.0) {
    log_error("mem_per_job_gb must be > 0");
    cfg.valid = false;
  }
}

void
parse_limits(const YAML::Node& root, RuntimeConfig& cfg)
{
  const auto node = section_node(root, "limits", cfg);
  if (!node) {
    return;
  }
  static const KeySet kKeys{
      "max_upload_mb", "max_pages", "download_chunk_mb",
      "download_timeout_seconds"};
  if (!validate_keys(node, kKeys, "limits", cfg)) {
    return;
  }
  read_positive_int(node, "max_upload_mb", cfg.limits.max_upload_mb);
  read_positive_int(node, "max_pages", cfg.limits.max_pages);
  read_positive_int(node, "download_chunk_mb", cfg.limits.download_chunk_mb);
  read_positive_int(
      node, "download_timeout_seconds", cfg.limits.download_timeout_seconds);
}

void
parse_batching(const YAML::Node& root, RuntimeConfig& cfg)
{
  const auto node = section_node(root, "batching", cfg);
  if (!node) {
    return;
  }
  static const KeySet kKeys{"enable_auto_batch", "batch_page_size"};
  if (!validate_keys(node, kKeys, "batching", cfg)) {
    return;
  }
  read_bool(node, "enable_auto_batch", cfg.batching.enable_auto_batch);
  read_positive_int(node, "batch_page_size", cfg.batching.batch_page_size);
}

void
parse_engine(const YAML::Node& root, RuntimeConfig& cfg)
{
  const auto node = section_node(root, "engine", cfg);
  if (!node) {
    return;
  }
  static const KeySet kKeys{
      "backend",    "fallback_backend",        "endpoint",
      "model_path", "request_timeout_seconds", "enabled"};
  if (!validate_keys(node, kKeys, "engine", cfg)) {
    return;
  }
  read_string(node, "backend", cfg.engine.backend);
  read_string(node, "fallback_backend", cfg.engine.fallback_backend);
  read_string(node, "endpoint", cfg.engine.endpoint);
  read_string(node, "model_path", cfg.engine.model_path);
  read_positive_int(
      node, "request_timeout_seconds", cfg.engine.request_timeout_seconds);
  read_bool(node, "enabled", cfg.engine.enabled);
  if (cfg.engine.backend.empty()) {
    log_error("engine.backend must not be empty");
    cfg.valid = false;
  }
  if (!cfg.engine.model_path.empty() &&
      !std::filesystem::exists(cfg.engine.model_path)) {
    log_error(std::format(
        "Model path does not exist: {}", cfg.engine.model_path));
    cfg.valid = false;
  }
}

void
parse_publish(const YAML::Node& root, RuntimeConfig& cfg)
{
  const auto node = section_node(root, "publish", cfg);
  if (!node) {
    return;
  }
  static const KeySet kKeys{
      "backend",           "auto_publish", "endpoint",
      "bucket",            "access_key_id", "access_key_secret",
      "prefix",            "sign_expire_seconds"};
  if (!validate_keys(node, kKeys, "publish", cfg)) {
    return;
  }
  auto& pub = cfg.publish;
  read_string(node, "backend", pub.backend);
  read_bool(node, "auto_publish", pub.auto_publish);
  read_string(node, "endpoint", pub.endpoint);
  read_string(node, "bucket", pub.bucket);
  read_string(node, "access_key_id", pub.access_key_id);
  read_string(node, "access_key_secret", pub.access_key_secret);
  read_string(node, "prefix", pub.prefix);
  read_positive_int(node, "sign_expire_seconds", pub.sign_expire_seconds);

  if (!kAllowedPublishBackends.contains(pub.backend)) {
    log_error(std::format("Unknown publish backend: {}", pub.backend));
    cfg.valid = false;
    return;
  }
  if (pub.backend == "remote" &&
      (pub.endpoint.empty() || pub.bucket.empty() ||
       pub.access_key_id.empty() || pub.access_key_secret.empty())) {
    log_error(
        "publish backend 'remote' requires endpoint, bucket, access_key_id "
        "and access_key_secret");
    cfg.valid = false;
  }
}

void
parse_tokens(const YAML::Node& root, RuntimeConfig& cfg)
{
  const auto node = section_node(root, "tokens", cfg);
  if (!node) {
    return;
  }
  static const KeySet kKeys{
      "store_path", "default_ttl_seconds", "default_max_downloads"};
  if (!validate_keys(node, kKeys, "tokens", cfg)) {
    return;
  }
  read_string(node, "store_path", cfg.tokens.store_path);
  read_non_negative_int(
      node, "default_ttl_seconds", cfg.tokens.default_ttl_seconds);
  read_positive_int(
      node, "default_max_downloads", cfg.tokens.default_max_downloads);
}

void
parse_rate_limit(const YAML::Node& root, RuntimeConfig& cfg)
{
  const auto node = section_node(root, "rate_limit", cfg);
  if (!node) {
    return;
  }
  static const KeySet kKeys{
      "enabled", "rate_per_second", "burst", "bucket_ttl_seconds",
      "sweep_interval_seconds"};
  if (!validate_keys(node, kKeys, "rate_limit", cfg)) {
    return;
  }
  auto& limit = cfg.rate_limit;
  read_bool(node, "enabled", limit.enabled);
  read_non_negative_double(node, "rate_per_second", limit.rate_per_second);
  read_positive_int(node, "burst", limit.burst);
  read_positive_int(node, "bucket_ttl_seconds", limit.bucket_ttl_seconds);
  read_positive_int(
      node, "sweep_interval_seconds", limit.sweep_interval_seconds);
  if (limit.rate_per_second <= 0.0) {
    log_error("rate_limit.rate_per_second must be > 0");
    cfg.valid = false;
  }
}

auto
parse_root(const YAML::Node& root) -> RuntimeConfig
{
  RuntimeConfig cfg;
  const auto mark_invalid = [&cfg](const std::string& message) {
    log_error(std::string("Failed to load config: ") + message);
    cfg.valid = false;
  };
  try {
    if (!root || !root.IsMap()) {
      log_error("Config root must be a mapping");
      cfg.valid = false;
      return cfg;
    }

    static const KeySet kTopLevelKeys{
        "verbose", "verbosity", "metrics_port", "metrics_enabled",
        "storage", "scheduling", "limits",      "batching",
        "engine",  "publish",    "tokens",      "rate_limit"};
    if (!validate_keys(root, kTopLevelKeys, "", cfg)) {
      return cfg;
    }
    parse_top_level(root, cfg);
    parse_storage(root, cfg);
    parse_scheduling(root, cfg);
    parse_limits(root, cfg);
    parse_batching(root, cfg);
    parse_engine(root, cfg);
    parse_publish(root, cfg);
    parse_tokens(root, cfg);
    parse_rate_limit(root, cfg);
  }
  catch (const YAML::Exception& exception) {
    mark_invalid(exception.what());
  }
  catch (const std::invalid_argument& exception) {
    mark_invalid(exception.what());
  }
  catch (const std::filesystem::filesystem_error& exception) {
    mark_invalid(exception.what());
  }

  ConfigLoaderPostParseHook hook;
  {
    const std::scoped_lock lock(post_parse_hook_mutex());
    hook = post_parse_hook();
  }
  if (hook) {
    hook(cfg);
  }
  return cfg;
}

}  // namespace

auto
load_config(const std::string& path) -> RuntimeConfig
{
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  }
  catch (const YAML::Exception& exception) {
    RuntimeConfig cfg;
    log_error(std::string("Failed to load config: ") + exception.what());
    cfg.valid = false;
    cfg.config_path = path;
    return cfg;
  }
  RuntimeConfig cfg = parse_root(root);
  cfg.config_path = path;
  return cfg;
}

auto
load_config_from_string(const std::string& yaml) -> RuntimeConfig
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  }
  catch (const YAML::Exception& exception) {
    RuntimeConfig cfg;
    log_error(std::string("Failed to load config: ") + exception.what());
    cfg.valid = false;
    return cfg;
  }
  return parse_root(root);
}

void
set_config_loader_post_parse_hook(ConfigLoaderPostParseHook hook)
{
  const std::scoped_lock lock(post_parse_hook_mutex());
  post_parse_hook() = std::move(hook);
}

void
reset_config_loader_post_parse_hook()
{
  const std::scoped_lock lock(post_parse_hook_mutex());
  post_parse_hook() = nullptr;
}

}  // namespace docpipe
