#pragma once

#include <peerrec/profile.hpp>
#include <peerrec/types.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace peerrec {

/** similarity_score (else score) clamped to [0, 1]; 0 when absent or not finite. */
double SimilarityFeature(const CandidateRow& row);

/** 0.5^(age_days / half_life_days); 0 when unpublished or half_life_days <= 0. */
double FreshnessScore(int64_t published_at_ms, int64_t now_ms, double half_life_days);

/** log1p(w) / (log1p(w) + 1) with w = views * view_weight + likes * like_weight. */
double PopularityFeature(int64_t views, int64_t likes, const ScoringConfig& cfg);

/**
 * Score one row in place:
 *   similarity_weight * sim + freshness_weight * fresh
 *     + popularity_weight * pop + layer_weight(layer)
 * Sets score, similarity_score and the debug features; returns the score.
 */
double ScoreCandidate(CandidateRow* row,
                      const ScoringConfig& cfg,
                      std::string_view layer,
                      int64_t now_ms);

/** Record min / max similarity of rows as debug pool bounds on each row. */
void AttachPoolBounds(std::vector<CandidateRow>* rows);

/**
 * Score every row with layer, sort by score (descending, stable) and set
 * rank_before / rank_after to the sorted position.
 */
void ScoreAndRank(std::vector<CandidateRow>* rows,
                  const ScoringConfig& cfg,
                  std::string_view layer,
                  int64_t now_ms);

}  // namespace peerrec
