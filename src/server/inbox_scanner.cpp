#include "inbox_scanner.hpp"

#include <algorithm>
#include <format>
#include <system_error>
#include <vector>

#include "storage/job_storage.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace docpipe {

namespace {

auto
is_pending_upload(const std::filesystem::path& file) -> bool
{
  const auto name = file.filename().string();
  return name.empty() || name.front() == '.' || name.ends_with(".part");
}

}  // namespace

InboxScanner::InboxScanner(
    TaskService& service, std::chrono::milliseconds interval)
    : service_(service), interval_(interval),
      inbox_(service.storage_root() / kInboxDirName)
{
  std::error_code ec;
  std::filesystem::create_directories(inbox_ / kInboxRejectedDirName, ec);
  if (ec) {
    throw StorageException(std::format(
        "Cannot create inbox {}: {}", inbox_.string(), ec.message()));
  }
}

InboxScanner::~InboxScanner()
{
  stop();
}

void
InboxScanner::reject(const std::filesystem::path& file, const std::string& reason)
{
  log_warning(std::format(
      "Rejected inbox file {}: {}", file.filename().string(), reason));
  std::error_code ec;
  std::filesystem::rename(
      file, inbox_ / kInboxRejectedDirName / file.filename(), ec);
  if (ec) {
    log_error(std::format(
        "Cannot move {} out of the inbox: {}", file.string(), ec.message()));
  }
}

auto
InboxScanner::scan_once() -> InboxScanResult
{
  InboxScanResult result;
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(inbox_, ec)) {
    std::error_code type_ec;
    if (entry.is_regular_file(type_ec) && !is_pending_upload(entry.path())) {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    log_error(std::format("Cannot list {}: {}", inbox_.string(), ec.message()));
    return result;
  }
  std::ranges::sort(files);

  const auto verbosity = service_.config().verbosity;
  for (const auto& file : files) {
    if (!is_supported_input(file.filename().string())) {
      reject(file, "unsupported file type");
      ++result.rejected;
      continue;
    }
    try {
      const auto task_id = service_.submit_file(kInboxClientKey, file, JobOptions{});
      std::filesystem::remove(file, ec);
      if (ec) {
        log_warning(std::format(
            "Task {} created but {} could not be removed: {}", task_id,
            file.string(), ec.message()));
      }
      log_info(
          verbosity, std::format(
                         "Inbox file {} queued as task {}",
                         file.filename().string(), task_id));
      ++result.accepted;
    }
    catch (const QueueFullException&) {
      ++result.deferred;
      break;
    }
    catch (const RateLimitedException&) {
      ++result.deferred;
      break;
    }
    catch (const EngineLoadException& e) {
      log_warning(std::format(
          "Inbox scan paused, engine unavailable: {}", e.what()));
      ++result.deferred;
      break;
    }
    catch (const ValidationException& e) {
      reject(file, e.what());
      ++result.rejected;
    }
    catch (const DocpipeException& e) {
      const auto error = describe_error(e);
      reject(
          file, std::format("[{}] {}", error_kind_name(error.kind), error.message));
      ++result.rejected;
    }
  }
  return result;
}

void
InboxScanner::start()
{
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::jthread([this](const std::stop_token& stop) { run(stop); });
}

void
InboxScanner::stop()
{
  if (thread_.joinable()) {
    thread_.request_stop();
    cv_.notify_all();
    thread_.join();
  }
}

void
InboxScanner::run(const std::stop_token& stop)
{
  set_thread_log_tag("inbox");
  while (!stop.stop_requested()) {
    try {
      static_cast<void>(scan_once());
    }
    catch (const std::exception& e) {
      log_error(std::format("Inbox scan failed: {}", e.what()));
    }
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, stop, interval_, [] { return false; });
  }
}

}  // namespace docpipe
