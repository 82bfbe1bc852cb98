#include "rate_limiter.hpp"

#include <algorithm>
#include <utility>

#include "utils/logger.hpp"

namespace docpipe {

RateLimiter::RateLimiter(
    const RuntimeConfig::RateLimitSettings& settings, TimeSource now,
    bool start_sweeper)
    : enabled_(settings.enabled),
      rate_(std::max(0.1, settings.rate_per_second)),
      burst_(static_cast<double>(std::max(1, settings.burst))),
      ttl_(std::chrono::seconds(std::max(1, settings.bucket_ttl_seconds))),
      sweep_interval_(std::max(1, settings.sweep_interval_seconds)),
      now_(std::move(now))
{
  if (!now_) {
    now_ = [] { return Clock::now(); };
  }
  if (start_sweeper && enabled_) {
    sweeper_ = std::jthread(
        [this](const std::stop_token& stop) { sweep_loop(stop); });
  }
}

RateLimiter::~RateLimiter()
{
  stop();
}

auto
RateLimiter::allow(std::string_view key, double cost) -> bool
{
  if (!enabled_) {
    return true;
  }
  const auto now = now_();
  const std::scoped_lock lock(mutex_);
  auto it = buckets_.find(key);
  if (it == buckets_.end()) {
    it = buckets_.emplace(std::string(key), Bucket{burst_, now}).first;
  }
  auto& bucket = it->second;
  const double elapsed = std::max(
      0.0, std::chrono::duration<double>(now - bucket.last).count());
  bucket.tokens = std::min(burst_, bucket.tokens + rate_ * elapsed);
  bucket.last = now;
  if (bucket.tokens >= cost) {
    bucket.tokens -= cost;
    return true;
  }
  return false;
}

auto
RateLimiter::sweep() -> std::size_t
{
  const auto cutoff = now_() - ttl_;
  const std::scoped_lock lock(mutex_);
  return std::erase_if(
      buckets_, [cutoff](const auto& entry) { return entry.second.last < cutoff; });
}

void
RateLimiter::stop()
{
  if (sweeper_.joinable()) {
    sweeper_.request_stop();
    sweep_cv_.notify_all();
    sweeper_.join();
  }
}

auto
RateLimiter::bucket_count() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return buckets_.size();
}

auto
RateLimiter::tokens(std::string_view key) const -> double
{
  const std::scoped_lock lock(mutex_);
  if (const auto it = buckets_.find(key); it != buckets_.end()) {
    return it->second.tokens;
  }
  return burst_;
}

void
RateLimiter::sweep_loop(const std::stop_token& stop)
{
  set_thread_log_tag("rate-limit-sweeper");
  while (!stop.stop_requested()) {
    {
      std::unique_lock lock(sweep_mutex_);
      sweep_cv_.wait_for(lock, stop, sweep_interval_, [] { return false; });
    }
    if (stop.stop_requested()) {
      break;
    }
    sweep();
  }
}

}  // namespace docpipe
