#pragma once

#include <peerrec/clock.hpp>

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace peerrec {

/**
 * Sliding-window admission control keyed by an arbitrary string
 * (the HTTP layer uses "ip:path").
 *
 * Allow(key) drops timestamps older than now - window from the key's bucket
 * and admits when fewer than max_requests remain, recording the admission.
 * At most once per window, buckets with no live timestamps are erased.
 * Always admits when max_requests <= 0 or window_seconds <= 0.
 * Thread-safe; one internal mutex held for the bucket maintenance only.
 */
class RateLimiter {
 public:
  RateLimiter(int max_requests, double window_seconds, const Clock* clock = nullptr);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  bool Allow(std::string_view key);

  int max_requests() const { return max_requests_; }
  double window_seconds() const { return window_seconds_; }

  /** Number of keys with a live bucket. */
  size_t BucketCount() const;

 private:
  const int max_requests_;
  const double window_seconds_;
  const uint64_t window_us_;
  const Clock* clock_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, std::deque<uint64_t>> buckets_;
  uint64_t last_sweep_us_ = 0;
};

}  // namespace peerrec
