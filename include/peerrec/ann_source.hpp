#pragma once

#include <peerrec/store.hpp>
#include <peerrec/types.hpp>
#include <peerrec/vector_index.hpp>

#include <cstddef>
#include <vector>

#include <rocksdb/status.h>

namespace peerrec {

/** ANN search tuning for similarity lookups. */
struct AnnSearchOptions {
  // L2-normalize query vectors before searching.
  bool normalize_queries = true;

  // Minimum neighbours requested from the index, to leave room for filtering.
  size_t search_limit = 5000;

  // Per-author cap while accumulating one answer (0 = unlimited).
  int max_per_author = 1;

  // Drop neighbours sharing the seed's (channel_id, instance_domain).
  bool exclude_source_author = false;
};

/**
 * Nearest neighbours of a seed video from the ANN index, resolved against
 * the catalog. Items are ranked 1..N in acceptance order.
 */
class AnnSimilaritySource {
 public:
  AnnSimilaritySource(const Store* store,
                      const internal::VectorIndex* index,
                      AnnSearchOptions opt = AnnSearchOptions{});

  /**
   * Up to limit neighbours of seed. The seed row itself, rows without
   * metadata, and rows over the author caps are skipped. A seed with an
   * empty or zero-norm embedding yields an empty result.
   */
  rocksdb::Status GetCandidates(const SeedVideo& seed,
                                size_t limit,
                                std::vector<SimilarItem>* out) const;

  const AnnSearchOptions& options() const { return opt_; }

 private:
  const Store* store_;
  const internal::VectorIndex* index_;
  AnnSearchOptions opt_;
};

}  // namespace peerrec
