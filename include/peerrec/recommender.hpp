#pragma once

#include <peerrec/ann_source.hpp>
#include <peerrec/candidate_source.hpp>
#include <peerrec/generators.hpp>
#include <peerrec/moderation.hpp>
#include <peerrec/personalize.hpp>
#include <peerrec/profile.hpp>
#include <peerrec/request_context.hpp>
#include <peerrec/similarity_cache.hpp>
#include <peerrec/store.hpp>
#include <peerrec/types.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace peerrec {

/** Wiring and limits of the recommendation pipeline. */
struct RecommenderOptions {
  // Primary likes source; "cache-optimized" gets "ann" as its fallback.
  std::string likes_source = kCacheOptimizedSourceName;
  LikesSourceSettings likes;

  // Treat every request as refresh_cache.
  bool refresh_similarity_cache = false;

  PersonalizationSettings personalization;
  ModerationSettings moderation;

  // Result size when a request asks for 0, and the upper bound otherwise.
  size_t default_limit = 48;
};

/** One recommendation request, already parsed. */
struct RecommendRequest {
  std::string user_id;
  std::string mode;  // empty: "home" without a seed, "upnext" with one
  size_t limit = 0;  // 0: default_limit
  bool refresh_cache = false;
  bool random = false;

  // Seed reference; any non-empty id or uuid selects the related path.
  std::string video_id;
  std::string video_uuid;
  std::string host;

  bool HasSeed() const { return !video_id.empty() || !video_uuid.empty(); }
};

/** Which path produced a response. */
enum class RecommendPath {
  kRandom,          // random rows on request
  kHome,            // mixed layers for the user
  kHomeRandomFill,  // mixer returned nothing; random rows instead
  kRelated          // neighbours of a seed video
};

struct RecommendResponse {
  RecommendPath path = RecommendPath::kHome;
  std::string mode;
  std::string profile;

  bool has_seed = false;
  VideoRecord seed;

  std::vector<CandidateRow> rows;
  ModerationFilterStats moderation;
};

/**
 * Request orchestrator.
 *
 * Home path: resolve the profile, run its generators, mix. Related path:
 * similar candidates of the seed, scored and ranked with the profile. Both
 * end with the same tail: diversify (liked videos pre-seeded as seen),
 * personalize (related path only), moderate, truncate.
 */
class Recommender {
 public:
  /**
   * Build the pipeline. ann may be null (similarity answers then come from
   * the cache only). Fails with InvalidArgument for an unknown likes source.
   */
  static rocksdb::Status Create(Store* store,
                                const AnnSimilaritySource* ann,
                                RecommendationConfig config,
                                RecommenderOptions opt,
                                std::unique_ptr<Recommender>* out);

  Recommender(const Recommender&) = delete;
  Recommender& operator=(const Recommender&) = delete;

  /**
   * Serve one request. An unresolvable seed fails with InvalidArgument
   * ("Missing vector or video reference"); storage failures are returned.
   */
  rocksdb::Status Recommend(const RequestContext& ctx,
                            const RecommendRequest& req,
                            RecommendResponse* out) const;

  /** The mixer alone: up to limit rows of profile for user_id, before the common tail. */
  rocksdb::Status MixForUser(const RequestContext& ctx,
                             const UserTaste& taste,
                             const Profile& profile,
                             std::string_view user_id,
                             size_t limit,
                             bool refresh_cache,
                             std::vector<CandidateRow>* out) const;

  const RecommendationConfig& config() const { return config_; }
  const RecommenderOptions& options() const { return opt_; }
  const SimilarityService& similarity() const { return *similarity_; }

  /** 0 maps to default_limit; larger values are capped at it. */
  size_t ClampLimit(size_t requested) const;

 private:
  Recommender(Store* store, RecommendationConfig config, RecommenderOptions opt);

  rocksdb::Status RandomRows(const RequestContext& ctx, size_t limit,
                             std::vector<CandidateRow>* out) const;
  rocksdb::Status RelatedRows(const RequestContext& ctx,
                              const SeedVideo& seed,
                              const Profile& profile,
                              std::string_view mode,
                              bool refresh_cache,
                              std::vector<CandidateRow>* out) const;
  rocksdb::Status FinishRows(const RequestContext& ctx,
                             const UserTaste& taste,
                             const DiversityCaps& caps,
                             std::string_view user_id,
                             bool personalize,
                             size_t limit,
                             RecommendResponse* out) const;

  Store* store_;
  RecommendationConfig config_;
  RecommenderOptions opt_;

  std::unique_ptr<SimilarityService> similarity_;
  std::unique_ptr<CandidateSource> likes_source_;
  std::unique_ptr<CandidateSource> likes_fallback_;
  std::map<std::string, std::unique_ptr<CandidateGenerator>> generators_;
  std::unique_ptr<PersonalizedReranker> reranker_;
};

}  // namespace peerrec
