#pragma once

#include <peerrec/request_context.hpp>
#include <peerrec/similarity_cache.hpp>
#include <peerrec/store.hpp>
#include <peerrec/types.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace peerrec {

/** Fan-out settings of the likes-based candidate pipeline. */
struct LikesSourceSettings {
  // Likes read per request, most recent first.
  size_t max_likes = 100;
  // Likes actually used as seeds; larger sets are sampled down uniformly.
  size_t max_likes_for_recs = 10;
  // Neighbours requested per seed.
  size_t similar_per_like = 1000;

  bool require_full_cache = false;
  // "cache-optimized" only: run the ANN search when the cache misses.
  bool allow_ann_on_cache_miss = true;
};

/** Collaborators shared by all candidate sources. Not owned. */
struct CandidateSourceDeps {
  const Store* store = nullptr;
  const SimilarityService* similarity = nullptr;
};

/**
 * Produces candidates similar to a user's recent likes.
 *
 * The pool excludes liked videos and duplicates across seeds and is shuffled
 * with the request's random source before truncation, so callers must not
 * rely on its order.
 */
class CandidateSource {
 public:
  virtual ~CandidateSource() = default;

  virtual const char* name() const = 0;

  virtual rocksdb::Status GetCandidates(const RequestContext& ctx,
                                        std::string_view user_id,
                                        size_t limit,
                                        bool refresh_cache,
                                        std::vector<CandidateRow>* out) const = 0;
};

constexpr const char* kAnnSourceName = "ann";
constexpr const char* kCacheOptimizedSourceName = "cache-optimized";

/**
 * Build a candidate source by name: "ann" (ANN search on every cache miss)
 * or "cache-optimized" (ANN search only when allow_ann_on_cache_miss).
 * Returns nullptr and sets error_out for unknown names.
 */
std::unique_ptr<CandidateSource> CreateCandidateSource(std::string_view name,
                                                       const CandidateSourceDeps& deps,
                                                       const LikesSourceSettings& settings,
                                                       std::string* error_out = nullptr);

}  // namespace peerrec
