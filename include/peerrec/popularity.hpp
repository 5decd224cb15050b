#pragma once

#include <cstdint>

namespace peerrec {

constexpr double kDefaultLikeWeight = 2.0;

// Age assumed for rows without a usable publish timestamp (~10 years).
constexpr double kUnknownAgeDays = 3650.0;

constexpr int64_t kMillisPerDay = 86400000;

/**
 * Decayed engagement score:
 *   (views + like_weight * likes) / (1 + age_days / 30)
 * views and likes are clamped at zero; published_at_ms <= 0 means unknown.
 * Non-decreasing in views and likes, non-increasing in age.
 */
double PopularityScore(int64_t views,
                       int64_t likes,
                       int64_t published_at_ms,
                       int64_t now_ms,
                       double like_weight = kDefaultLikeWeight);

}  // namespace peerrec
