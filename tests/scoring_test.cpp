// Unit tests for peerrec/scoring.hpp and peerrec/popularity.hpp
// Tests: feature extraction, linear scoring, ranking, decayed popularity

#include <gtest/gtest.h>

#include <peerrec/popularity.hpp>
#include <peerrec/scoring.hpp>
#include <peerrec/test_utils.hpp>

#include <cmath>
#include <limits>
#include <vector>

namespace peerrec {
namespace {

using testing::MakeRow;
using testing::MakeVideo;

constexpr int64_t kNow = 1700000000000;

// =============================================================================
// Features
// =============================================================================

TEST(ScoringFeatureTest, SimilarityClampedToUnitRange) {
  CandidateRow row;
  EXPECT_DOUBLE_EQ(SimilarityFeature(row), 0.0);

  row.has_score = true;
  row.score = 0.4;
  EXPECT_DOUBLE_EQ(SimilarityFeature(row), 0.4);

  row.has_similarity = true;
  row.similarity_score = 1.7;
  EXPECT_DOUBLE_EQ(SimilarityFeature(row), 1.0);

  row.similarity_score = -0.3;
  EXPECT_DOUBLE_EQ(SimilarityFeature(row), 0.0);

  row.similarity_score = std::numeric_limits<double>::quiet_NaN();
  EXPECT_DOUBLE_EQ(SimilarityFeature(row), 0.0);
}

TEST(ScoringFeatureTest, FreshnessHalvesPerHalfLife) {
  EXPECT_DOUBLE_EQ(FreshnessScore(kNow, kNow, 14.0), 1.0);
  EXPECT_NEAR(FreshnessScore(kNow - 14 * kMillisPerDay, kNow, 14.0), 0.5, 1e-12);
  EXPECT_NEAR(FreshnessScore(kNow - 28 * kMillisPerDay, kNow, 14.0), 0.25, 1e-12);
  // Future timestamps count as brand new.
  EXPECT_DOUBLE_EQ(FreshnessScore(kNow + kMillisPerDay, kNow, 14.0), 1.0);

  EXPECT_DOUBLE_EQ(FreshnessScore(0, kNow, 14.0), 0.0);
  EXPECT_DOUBLE_EQ(FreshnessScore(kNow, kNow, 0.0), 0.0);
}

TEST(ScoringFeatureTest, PopularityIsBoundedAndMonotonic) {
  ScoringConfig cfg;
  EXPECT_DOUBLE_EQ(PopularityFeature(0, 0, cfg), 0.0);
  EXPECT_DOUBLE_EQ(PopularityFeature(-5, -5, cfg), 0.0);

  const double w = std::log1p(10.0);
  EXPECT_NEAR(PopularityFeature(10, 0, cfg), w / (w + 1.0), 1e-12);

  double prev = 0.0;
  for (int64_t views : {1, 10, 100, 10000, 1000000}) {
    double value = PopularityFeature(views, 0, cfg);
    EXPECT_GT(value, prev);
    EXPECT_LT(value, 1.0);
    prev = value;
  }
  EXPECT_GT(PopularityFeature(10, 1, cfg), PopularityFeature(10, 0, cfg));
}

// =============================================================================
// ScoreCandidate / ScoreAndRank
// =============================================================================

TEST(ScoreCandidateTest, LinearCombination) {
  ScoringConfig cfg;
  cfg.similarity_weight = 1.0;
  cfg.freshness_weight = 0.5;
  cfg.popularity_weight = 0.25;
  cfg.layer_weights = {{"exploit", 0.15}};

  CandidateRow row = MakeRow(MakeVideo("v1", "a.example", "", kNow - 14 * kMillisPerDay), 0.8);
  row.video.views = 10;

  const double pop = PopularityFeature(10, 0, cfg);
  double score = ScoreCandidate(&row, cfg, "exploit", kNow);

  EXPECT_NEAR(score, 0.8 + 0.5 * 0.5 + 0.25 * pop + 0.15, 1e-9);
  EXPECT_DOUBLE_EQ(row.score, score);
  EXPECT_TRUE(row.has_similarity);
  EXPECT_DOUBLE_EQ(row.similarity_score, 0.8);
  EXPECT_NEAR(row.debug.freshness_score, 0.5, 1e-9);
  EXPECT_DOUBLE_EQ(row.debug.popularity_score, pop);
  EXPECT_EQ(row.debug.layer, "exploit");
  EXPECT_DOUBLE_EQ(cfg.LayerWeight("random"), 0.0);
}

TEST(ScoreAndRankTest, SortsAndRanks) {
  ScoringConfig cfg;
  std::vector<CandidateRow> rows = {
      MakeRow(MakeVideo("low", "a.example"), 0.1),
      MakeRow(MakeVideo("high", "a.example"), 0.9),
      MakeRow(MakeVideo("mid", "a.example"), 0.5),
  };

  ScoreAndRank(&rows, cfg, "related", kNow);

  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].video.video_id, "high");
  EXPECT_EQ(rows[1].video.video_id, "mid");
  EXPECT_EQ(rows[2].video.video_id, "low");
  for (size_t i = 0; i < rows.size(); ++i) {
    EXPECT_EQ(rows[i].debug.rank_before, static_cast<int>(i + 1));
    EXPECT_EQ(rows[i].debug.rank_after, static_cast<int>(i + 1));
    EXPECT_TRUE(rows[i].debug.has_pool_bounds);
    EXPECT_DOUBLE_EQ(rows[i].debug.pool_min, 0.1);
    EXPECT_DOUBLE_EQ(rows[i].debug.pool_max, 0.9);
  }
}

TEST(ScoreAndRankTest, EqualScoresKeepInputOrder) {
  ScoringConfig cfg;
  std::vector<CandidateRow> rows = {
      MakeRow(MakeVideo("first", "a.example"), 0.5),
      MakeRow(MakeVideo("second", "a.example"), 0.5),
  };
  ScoreAndRank(&rows, cfg, "", kNow);
  EXPECT_EQ(rows[0].video.video_id, "first");
  EXPECT_EQ(rows[1].video.video_id, "second");
}

// =============================================================================
// PopularityScore
// =============================================================================

TEST(PopularityScoreTest, DecaysWithAge) {
  const int64_t published = kNow - 30 * kMillisPerDay;
  EXPECT_DOUBLE_EQ(PopularityScore(100, 10, published, kNow), 60.0);
  EXPECT_DOUBLE_EQ(PopularityScore(100, 10, kNow, kNow), 120.0);
  EXPECT_DOUBLE_EQ(PopularityScore(100, 10, published, kNow, 0.0), 50.0);
}

TEST(PopularityScoreTest, UnknownAgeUsesTenYears) {
  EXPECT_DOUBLE_EQ(PopularityScore(0, 0, 0, kNow), 0.0);
  EXPECT_DOUBLE_EQ(PopularityScore(1220, 0, 0, kNow), 1220.0 / (1.0 + kUnknownAgeDays / 30.0));
}

TEST(PopularityScoreTest, NegativeCountsClamped) {
  EXPECT_DOUBLE_EQ(PopularityScore(-10, -3, kNow, kNow), 0.0);
}

TEST(PopularityScoreTest, Monotonic) {
  const int64_t published = kNow - 10 * kMillisPerDay;
  EXPECT_LE(PopularityScore(10, 1, published, kNow), PopularityScore(11, 1, published, kNow));
  EXPECT_LE(PopularityScore(10, 1, published, kNow), PopularityScore(10, 2, published, kNow));
  EXPECT_GE(PopularityScore(10, 1, published, kNow),
            PopularityScore(10, 1, published - kMillisPerDay, kNow));
}

}  // namespace
}  // namespace peerrec
