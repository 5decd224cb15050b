#include <peerrec/scoring.hpp>

#include <peerrec/popularity.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace peerrec {

double SimilarityFeature(const CandidateRow& row) {
  double value = 0.0;
  if (row.has_similarity) {
    value = row.similarity_score;
  } else if (row.has_score) {
    value = row.score;
  }
  if (!std::isfinite(value) || value < 0.0) return 0.0;
  return std::min(value, 1.0);
}

double FreshnessScore(int64_t published_at_ms, int64_t now_ms, double half_life_days) {
  if (published_at_ms <= 0 || half_life_days <= 0.0) return 0.0;
  const int64_t age_ms = std::max<int64_t>(now_ms - published_at_ms, 0);
  const double age_days = static_cast<double>(age_ms) / static_cast<double>(kMillisPerDay);
  return std::pow(0.5, age_days / half_life_days);
}

double PopularityFeature(int64_t views, int64_t likes, const ScoringConfig& cfg) {
  const double weighted = cfg.popularity_view_weight * static_cast<double>(std::max<int64_t>(views, 0)) +
                          cfg.popularity_like_weight * static_cast<double>(std::max<int64_t>(likes, 0));
  if (!(weighted > 0.0)) return 0.0;
  const double scaled = std::log1p(weighted);
  return scaled / (scaled + 1.0);
}

double ScoreCandidate(CandidateRow* row,
                      const ScoringConfig& cfg,
                      std::string_view layer,
                      int64_t now_ms) {
  const double similarity = SimilarityFeature(*row);
  const double freshness = FreshnessScore(row->video.published_at, now_ms,
                                          cfg.freshness_half_life_days);
  const double popularity = PopularityFeature(row->video.views, row->video.likes, cfg);

  const double score = cfg.similarity_weight * similarity +
                       cfg.freshness_weight * freshness +
                       cfg.popularity_weight * popularity +
                       cfg.LayerWeight(layer);

  row->similarity_score = similarity;
  row->has_similarity = true;
  row->score = score;
  row->has_score = true;
  row->debug.freshness_score = freshness;
  row->debug.popularity_score = popularity;
  if (!layer.empty()) row->debug.layer = std::string(layer);
  return score;
}

void AttachPoolBounds(std::vector<CandidateRow>* rows) {
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  bool any = false;
  for (const auto& row : *rows) {
    if (!row.has_similarity || !std::isfinite(row.similarity_score)) continue;
    lo = std::min(lo, row.similarity_score);
    hi = std::max(hi, row.similarity_score);
    any = true;
  }
  for (auto& row : *rows) {
    row.debug.has_pool_bounds = any;
    row.debug.pool_min = any ? lo : 0.0;
    row.debug.pool_max = any ? hi : 0.0;
  }
}

void ScoreAndRank(std::vector<CandidateRow>* rows,
                  const ScoringConfig& cfg,
                  std::string_view layer,
                  int64_t now_ms) {
  if (!rows || rows->empty()) return;

  for (auto& row : *rows) ScoreCandidate(&row, cfg, layer, now_ms);

  std::stable_sort(rows->begin(), rows->end(),
                   [](const CandidateRow& a, const CandidateRow& b) { return a.score > b.score; });

  AttachPoolBounds(rows);
  for (size_t i = 0; i < rows->size(); ++i) {
    CandidateDebug& d = (*rows)[i].debug;
    d.rank_before = static_cast<int>(i + 1);
    d.rank_after = static_cast<int>(i + 1);
    d.has_explore_stats = true;
    d.explore_min = 0.0;
    d.explore_max = 1.0;
    d.explore_empty = false;
  }
}

}  // namespace peerrec
