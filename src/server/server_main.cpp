#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <mutex>
#include <span>
#include <string>
#include <string_view>

#include "core/task_service.hpp"
#include "inbox_scanner.hpp"
#include "monitoring/metrics.hpp"
#include "signal_handler.hpp"
#include "utils/config_loader.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace docpipe {

auto
handle_program_arguments(std::span<char const* const> args) -> RuntimeConfig
{
  const char* config_path = nullptr;

  auto remaining = args.subspan(1);
  auto require_value = [&](std::string_view flag) {
    if (remaining.empty() || remaining.front() == nullptr) {
      log_fatal(std::format("Missing value for {} argument.\n", flag));
    }
    const char* value = remaining.front();
    remaining = remaining.subspan(1);
    return value;
  };

  while (!remaining.empty()) {
    const char* raw_arg = remaining.front();
    remaining = remaining.subspan(1);

    if (raw_arg == nullptr) {
      log_fatal("Unexpected null program argument.\n");
    }

    std::string_view arg{raw_arg};
    if (arg == "--config" || arg == "-c") {
      config_path = require_value(arg);
      continue;
    }
    log_fatal(std::format(
        "Unknown argument '{}'. Only --config/-c is supported; all other "
        "settings must live in the YAML file.\n",
        arg));
  }

  if (config_path == nullptr) {
    log_fatal("Missing required --config argument.\n");
  }

  RuntimeConfig cfg = load_config(config_path);
  if (!cfg.valid) {
    log_fatal("Invalid configuration file.\n");
  }

  log_info(cfg.verbosity, std::format("Configuration   : {}", cfg.config_path));
  log_info(cfg.verbosity, std::format("Storage root    : {}", cfg.storage.root));
  log_info(
      cfg.verbosity,
      std::format(
          "Engine          : {} (fallback: {})", cfg.engine.backend,
          cfg.engine.fallback_backend.empty() ? "none"
                                              : cfg.engine.fallback_backend));
  log_info(
      cfg.verbosity, std::format(
                         "Workers / queue : {} / {}", cfg.scheduling.max_workers,
                         cfg.scheduling.max_queue_size));
  return cfg;
}

// Blocks until SIGINT/SIGTERM, running the retention sweep periodically.
void
wait_for_shutdown(TaskService& service)
{
  auto& server_ctx = server_context();
  const auto sweep_period =
      std::chrono::seconds(service.config().storage.retention_sweep_seconds);
  constexpr auto kSignalPoll = std::chrono::milliseconds(100);
  auto next_sweep = std::chrono::steady_clock::now();

  std::unique_lock lock(server_ctx.stop_mutex);
  while (!server_ctx.stop_requested.load()) {
    if (std::chrono::steady_clock::now() >= next_sweep) {
      lock.unlock();
      try {
        service.sweep_storage();
        service.tokens().purge_dead();
      }
      catch (const std::exception& e) {
        log_error(std::format("Retention sweep failed: {}", e.what()));
      }
      next_sweep = std::chrono::steady_clock::now() + sweep_period;
      lock.lock();
    }
    // signal_handler only flips the flag, so poll it.
    server_ctx.stop_cv.wait_for(
        lock, kSignalPoll, [] { return server_context().stop_requested.load(); });
  }
}

void
run_server(const RuntimeConfig& cfg)
{
  TaskService service(cfg);
  InboxScanner scanner(
      service, std::chrono::milliseconds(cfg.storage.inbox_scan_interval_ms));

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  service.start();
  scanner.start();
  log_info(
      cfg.verbosity,
      std::format("docpipe ready; watching {}", scanner.inbox_dir().string()));

  wait_for_shutdown(service);

  log_info(cfg.verbosity, "Shutting down");
  scanner.stop();
  service.stop();
}

}  // namespace docpipe

auto
main(int argc, char* argv[]) -> int
{
  try {
    docpipe::RuntimeConfig cfg = docpipe::handle_program_arguments(
        {argv, static_cast<size_t>(argc)});
    if (cfg.metrics_enabled && !docpipe::init_metrics(cfg.metrics_port)) {
      docpipe::log_warning(
          "Metrics server failed to start; continuing without metrics.");
    }
    docpipe::run_server(cfg);
    docpipe::shutdown_metrics();
  }
  catch (const docpipe::DocpipeException& e) {
    std::cerr << "\o{33}[1;31m[" << docpipe::error_kind_name(e.kind())
              << " error] " << e.what() << "\o{33}[0m\n";
    return 2;
  }
  catch (const std::exception& e) {
    std::cerr << "\o{33}[1;31m[General Error] " << e.what() << "\o{33}[0m\n";
    return -1;
  }

  return 0;
}
