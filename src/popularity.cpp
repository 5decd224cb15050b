#include <peerrec/popularity.hpp>

#include <algorithm>

namespace peerrec {

double PopularityScore(int64_t views,
                       int64_t likes,
                       int64_t published_at_ms,
                       int64_t now_ms,
                       double like_weight) {
  const double v = static_cast<double>(std::max<int64_t>(0, views));
  const double l = static_cast<double>(std::max<int64_t>(0, likes));

  double age_days = kUnknownAgeDays;
  if (published_at_ms > 0) {
    const int64_t age_ms = std::max<int64_t>(0, now_ms - published_at_ms);
    age_days = static_cast<double>(age_ms) / static_cast<double>(kMillisPerDay);
  }

  return (v + like_weight * l) / (1.0 + age_days / 30.0);
}

}  // namespace peerrec
