#include <peerrec/rate_limiter.hpp>

namespace peerrec {

RateLimiter::RateLimiter(int max_requests, double window_seconds, const Clock* clock)
    : max_requests_(max_requests),
      window_seconds_(window_seconds),
      window_us_(window_seconds > 0.0 ? static_cast<uint64_t>(window_seconds * 1e6) : 0),
      clock_(clock ? clock : SystemClock()) {}

bool RateLimiter::Allow(std::string_view key) {
  if (max_requests_ <= 0 || window_us_ == 0) return true;

  const uint64_t now = clock_->NowMicros();
  const uint64_t cutoff = now > window_us_ ? now - window_us_ : 0;

  std::lock_guard<std::mutex> lk(mu_);
  if (now - last_sweep_us_ >= window_us_) {
    for (auto it = buckets_.begin(); it != buckets_.end();) {
      if (it->second.empty() || it->second.back() <= cutoff) {
        it = buckets_.erase(it);
      } else {
        ++it;
      }
    }
    last_sweep_us_ = now;
  }

  auto& bucket = buckets_[std::string(key)];
  while (!bucket.empty() && bucket.front() <= cutoff) bucket.pop_front();

  if (bucket.size() >= static_cast<size_t>(max_requests_)) return false;
  bucket.push_back(now);
  return true;
}

size_t RateLimiter::BucketCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return buckets_.size();
}

}  // namespace peerrec
