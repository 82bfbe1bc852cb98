#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <thread>

#include "core/task_service.hpp"

namespace docpipe {

inline constexpr std::string_view kInboxRejectedDirName = "rejected";
inline constexpr std::string_view kInboxClientKey = "inbox";

struct InboxScanResult {
  std::size_t accepted = 0;
  std::size_t rejected = 0;
  std::size_t deferred = 0;
};

// =============================================================================
// InboxScanner: turns files dropped into <storage_root>/inbox into jobs
// -----------------------------------------------------------------------------
// Accepted files are removed from the inbox. Files the service refuses as
// invalid, or fails to store, go to inbox/rejected; files refused for
// capacity or rate reasons, or while the engine is unavailable, stay where
// they are and are retried on the next scan. Hidden files and files still
// being written (".part") are ignored.
// =============================================================================
class InboxScanner {
 public:
  InboxScanner(TaskService& service, std::chrono::milliseconds interval);
  ~InboxScanner();
  InboxScanner(const InboxScanner&) = delete;
  auto operator=(const InboxScanner&) -> InboxScanner& = delete;
  InboxScanner(InboxScanner&&) = delete;
  auto operator=(InboxScanner&&) -> InboxScanner& = delete;

  auto scan_once() -> InboxScanResult;

  void start();
  void stop();

  [[nodiscard]] auto inbox_dir() const -> const std::filesystem::path&
  {
    return inbox_;
  }

 private:
  void run(const std::stop_token& stop);
  void reject(const std::filesystem::path& file, const std::string& reason);

  TaskService& service_;
  std::chrono::milliseconds interval_;
  std::filesystem::path inbox_;
  std::mutex mutex_;
  std::condition_variable_any cv_;
  std::jthread thread_;
};

}  // namespace docpipe
