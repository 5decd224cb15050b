#pragma once

#include <peerrec/ann_source.hpp>
#include <peerrec/store.hpp>
#include <peerrec/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace peerrec {

/** Per-request cache eligibility. Never persisted. */
struct CachePolicy {
  bool refresh = false;       // ignore cached sets and overwrite them
  bool require_full = false;  // only serve sets stored for exactly this limit
  bool allow_read = true;
  bool allow_write = true;
};

/**
 * Policy layer over the persisted similarity sets in Store.
 *
 * A cached set is either absent or the complete answer of one earlier write;
 * the replace runs in a single RocksDB transaction.
 */
class SimilarityCache {
 public:
  explicit SimilarityCache(Store* store);

  /**
   * Cached neighbours of source_key in rank order. out is left empty (a miss)
   * when reads are disabled, policy.refresh is set, nothing is stored, a
   * stored score is not finite, the stored set is truncated, or
   * policy.require_full is set and the stored count differs from limit.
   */
  rocksdb::Status ReadCached(std::string_view source_key,
                             size_t limit,
                             const CachePolicy& policy,
                             std::vector<SimilarItem>* out) const;

  /** True when writes are allowed and policy.refresh is set or nothing is stored. */
  rocksdb::Status ShouldWrite(std::string_view source_key,
                              const CachePolicy& policy,
                              bool* out) const;

  /** Replace the stored set when ShouldWrite holds. */
  rocksdb::Status WriteCache(std::string_view source_key,
                             const std::vector<SimilarItem>& items,
                             int64_t computed_at,
                             const CachePolicy& policy,
                             bool* written = nullptr);

 private:
  Store* store_;
};

/** Cache and compute switches of one similarity lookup. */
struct SimilarCandidatesPolicy {
  bool refresh_cache = false;
  bool use_cache = true;
  bool require_full_cache = false;
  bool allow_cache_write = true;
  bool allow_compute = true;  // run the ANN search on a cache miss
};

/**
 * Unified similar-candidates pipeline: cache read, ANN compute on miss,
 * cache write, metadata resolution, then seed / source-author exclusion and
 * the per-author cap.
 *
 * Cache read and write failures degrade to a miss or a skipped write and are
 * counted as peerrec.similarity.cache_error_total. Storage failures while
 * computing or resolving metadata are returned.
 */
class SimilarityService {
 public:
  SimilarityService(Store* store, const AnnSimilaritySource* ann);

  rocksdb::Status GetSimilarCandidates(const SeedVideo& seed,
                                       size_t limit,
                                       const SimilarCandidatesPolicy& policy,
                                       std::vector<CandidateRow>* out) const;

 private:
  Store* store_;
  const AnnSimilaritySource* ann_;
  mutable SimilarityCache cache_;
};

}  // namespace peerrec
