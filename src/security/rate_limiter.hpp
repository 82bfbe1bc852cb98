#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "utils/runtime_config.hpp"
#include "utils/transparent_hash.hpp"

namespace docpipe {

// =============================================================================
// RateLimiter: per-key token buckets
// -----------------------------------------------------------------------------
// Each key starts with `burst` tokens and refills at `rate_per_second`, never
// above `burst`. Buckets untouched for `bucket_ttl_seconds` are removed by a
// background sweep so the map stays bounded by the set of active clients.
// =============================================================================
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;
  using TimeSource = std::function<Clock::time_point()>;

  explicit RateLimiter(
      const RuntimeConfig::RateLimitSettings& settings, TimeSource now = {},
      bool start_sweeper = true);
  ~RateLimiter();
  RateLimiter(const RateLimiter&) = delete;
  auto operator=(const RateLimiter&) -> RateLimiter& = delete;
  RateLimiter(RateLimiter&&) = delete;
  auto operator=(RateLimiter&&) -> RateLimiter& = delete;

  [[nodiscard]] auto allow(std::string_view key, double cost = 1.0) -> bool;

  // Removes stale buckets; returns how many were dropped.
  auto sweep() -> std::size_t;
  void stop();

  [[nodiscard]] auto bucket_count() const -> std::size_t;
  [[nodiscard]] auto tokens(std::string_view key) const -> double;

 private:
  struct Bucket {
    double tokens = 0.0;
    Clock::time_point last;
  };

  void sweep_loop(const std::stop_token& stop);

  bool enabled_;
  double rate_;
  double burst_;
  Clock::duration ttl_;
  std::chrono::seconds sweep_interval_;
  TimeSource now_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Bucket, TransparentHash, std::equal_to<>>
      buckets_;

  std::mutex sweep_mutex_;
  std::condition_variable_any sweep_cv_;
  std::jthread sweeper_;
};

}  // namespace docpipe
